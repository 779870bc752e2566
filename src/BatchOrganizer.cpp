#include "BatchOrganizer.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

BatchOrganizer::BatchOrganizer(OrganizerOptions options, std::ostream& out, std::ostream& err)
    : m_options(std::move(options)), m_out(out), m_err(err) {
    setExtensions(m_options.extensions);
}

const OrganizerOptions& BatchOrganizer::options() const {
    return m_options;
}

void BatchOrganizer::setExtensions(const std::vector<std::string>& extensions) {
    m_extensions.clear();
    const auto& source = extensions.empty() ? ConfigParser::builtInDefaultExtensions() : extensions;
    for (const auto& ext : source) {
        std::string normalized = normalizeExtension(ext);
        if (!normalized.empty()) {
            m_extensions.insert(std::move(normalized));
        }
    }
}

TransferResult BatchOrganizer::validate() const {
    std::error_code ec;
    if (m_options.source.empty() || !std::filesystem::is_directory(m_options.source, ec)) {
        return TransferError::sourceNotFound(m_options.source);
    }

    const std::filesystem::path target = m_options.resolvedTarget();
    ec.clear();
    if (!std::filesystem::is_directory(target, ec)) {
        return TransferError::destinationRootNotFound(target);
    }

    return TransferResult::success();
}

BatchSummary BatchOrganizer::organizeAll() {
    BatchSummary summary;

    for (const auto& file : collectCandidates()) {
        if (!isIncluded(file)) {
            continue;
        }
        organizeFile(file, summary);
    }

    m_out << "Done: " << summary.processed << " file(s) processed, " << summary.succeeded << " succeeded, "
          << summary.failed << " failed" << std::endl;
    return summary;
}

std::vector<std::filesystem::path> BatchOrganizer::collectCandidates() const {
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator iter(
        m_options.source, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        m_err << "Unable to enumerate `" << m_options.source.string() << "`: " << ec.message() << std::endl;
        return files;
    }

    const std::filesystem::recursive_directory_iterator end;
    while (iter != end) {
        // Symlinks are never candidates; transferring one would act on whatever it points at.
        std::error_code linkErr;
        std::error_code typeErr;
        const bool isSymlink = iter->is_symlink(linkErr);
        if (!isSymlink && !linkErr && iter->is_regular_file(typeErr) && !typeErr) {
            files.push_back(iter->path());
        }

        iter.increment(ec);
        if (ec) {
            // The iterator is unusable after a failed increment; keep what was found so far.
            m_err << "Stopped enumerating `" << m_options.source.string() << "`: " << ec.message() << std::endl;
            break;
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool BatchOrganizer::isIncluded(const std::filesystem::path& file) const {
    if (!file.has_extension()) {
        return false;
    }
    return m_extensions.count(normalizeExtension(file.extension().string())) > 0;
}

void BatchOrganizer::organizeFile(const std::filesystem::path& file, BatchSummary& summary) {
    const auto record = EpisodeParser::parse(file);
    if (!record) {
        ++summary.skipped;
        if (m_options.verbose) {
            m_err << "Skipped: cannot parse file name `" << file.filename().string() << "`" << std::endl;
        }
        return;
    }

    ++summary.processed;

    const std::filesystem::path target = m_options.resolvedTarget();
    TransferResult result = FileOrganizer::organize(*record, target, m_options.mode, m_options.dryRun, m_out);

    if (!result && m_options.mode == OperationMode::Link && m_options.fallbackMode && result.error().allowsFallback()) {
        if (m_options.verbose) {
            m_err << "Hard link failed, falling back to " << toString(*m_options.fallbackMode) << ": `"
                  << record->sourcePath << "`" << std::endl;
        }
        result = FileOrganizer::organize(*record, target, *m_options.fallbackMode, m_options.dryRun, m_out);
    }

    if (!result) {
        ++summary.failed;
        m_err << "Failed to organize `" << record->sourcePath << "`: " << result.error().message() << std::endl;
        return;
    }

    ++summary.succeeded;
    if (m_options.verbose && !m_options.dryRun) {
        m_out << "Organized `" << record->sourcePath << "` -> `"
              << (std::filesystem::path(record->title) / record->targetFileName()).string() << "`" << std::endl;
    }
}

std::string BatchOrganizer::normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    if (extension.empty()) {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}
