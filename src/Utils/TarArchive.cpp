// src/Utils/TarArchive.cpp
#include <Neo4jCtl/Utils/ArchivePath.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>
#include <Neo4jCtl/Utils/TarArchive.hpp>

#include <archive.h>
#include <archive_entry.h>

namespace Neo4jCtl::Utils {

    namespace {

        struct ReadArchiveDeleter {
            void operator()(struct archive *a) const {
                archive_read_close(a);
                archive_read_free(a);
            }
        };

        struct WriteArchiveDeleter {
            void operator()(struct archive *a) const {
                archive_write_close(a);
                archive_write_free(a);
            }
        };

        using ReadArchivePtr = std::unique_ptr<struct archive, ReadArchiveDeleter>;
        using WriteArchivePtr = std::unique_ptr<struct archive, WriteArchiveDeleter>;

        // Copies one entry's data blocks from the reader to the disk writer
        int copyData(struct archive *reader, struct archive *writer) {
            const void *buff;
            size_t size;
            la_int64_t offset;

            while (true) {
                int r = archive_read_data_block(reader, &buff, &size, &offset);
                if (r == ARCHIVE_EOF) {
                    return ARCHIVE_OK;
                }
                if (r != ARCHIVE_OK) {
                    return r;
                }
                if (archive_write_data_block(writer, buff, size, offset) < ARCHIVE_OK) {
                    return ARCHIVE_FATAL;
                }
            }
        }

        const char *errorString(struct archive *a) {
            const char *message = archive_error_string(a);
            return message ? message : "unknown libarchive error";
        }

    } // namespace

    TarArchive::TarArchive(const std::filesystem::path &archivePath) : m_archivePath(archivePath) {
        m_logger = Logger::GetOrCreateLogger("TarArchive");
    }

    std::string TarArchive::getLastError() const { return m_lastErrorMsg; }

    void TarArchive::setError(const std::string &message) {
        m_lastErrorMsg = message;
        m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
    }

    bool TarArchive::extractAll(const std::filesystem::path &outputDirectory, unsigned int stripComponents) {
        ReadArchivePtr reader(archive_read_new());
        WriteArchivePtr writer(archive_write_disk_new());
        if (!reader || !writer) {
            setError("archive_read_new or archive_write_disk_new failed.");
            return false;
        }

        archive_read_support_filter_all(reader.get());
        archive_read_support_format_all(reader.get());

        archive_write_disk_set_options(writer.get(),
            ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
        archive_write_disk_set_standard_lookup(writer.get());

        if (archive_read_open_filename(reader.get(), m_archivePath.string().c_str(), 32768) != ARCHIVE_OK) {
            setError(std::string("Failed to open archive: ") + errorString(reader.get()));
            return false;
        }

        std::error_code ec;
        std::filesystem::create_directories(outputDirectory, ec);
        if (ec) {
            setError("Failed to create directory " + outputDirectory.string() + ": " + ec.message());
            return false;
        }

        m_logger->info("[{}] Starting extraction to: {}", m_archivePath.filename().string(), outputDirectory.string());

        bool all_successful = true;
        struct archive_entry *entry = nullptr;
        int r;
        while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
            const char *raw_name = archive_entry_pathname(entry);
            std::string entry_name = raw_name ? raw_name : "";

            std::optional<std::filesystem::path> output_path =
                    archiveEntryDestination(outputDirectory, entry_name, stripComponents);
            if (!output_path) {
                m_logger->trace("[{}] Skipping entry: {}", m_archivePath.filename().string(), entry_name);
                archive_read_data_skip(reader.get());
                continue;
            }
            archive_entry_set_pathname(entry, output_path->string().c_str());

            if (const char *hardlink = archive_entry_hardlink(entry)) {
                std::optional<std::filesystem::path> link_target =
                        archiveEntryDestination(outputDirectory, hardlink, stripComponents);
                if (!link_target) {
                    m_logger->warn("[{}] Skipping hardlink with unusable target: {} -> {}",
                                   m_archivePath.filename().string(), entry_name, hardlink);
                    archive_read_data_skip(reader.get());
                    continue;
                }
                archive_entry_set_hardlink(entry, link_target->string().c_str());
            }

            int w = archive_write_header(writer.get(), entry);
            if (w < ARCHIVE_OK) {
                m_logger->warn("[{}] archive_write_header for {}: {}",
                               m_archivePath.filename().string(), output_path->string(), errorString(writer.get()));
                if (w < ARCHIVE_WARN) {
                    all_successful = false;
                    m_lastErrorMsg = std::string("Failed to write ") + output_path->string() + ": " + errorString(writer.get());
                    archive_read_data_skip(reader.get());
                    continue;
                }
            }

            if (archive_entry_size(entry) > 0) {
                if (copyData(reader.get(), writer.get()) != ARCHIVE_OK) {
                    setError("Failed to extract " + entry_name + ": " + errorString(reader.get()));
                    all_successful = false;
                }
            }

            if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
                setError("Failed to finish " + output_path->string() + ": " + errorString(writer.get()));
                all_successful = false;
            }
        }

        if (r != ARCHIVE_EOF) {
            setError(std::string("Error reading archive header: ") + errorString(reader.get()));
            return false;
        }

        m_logger->debug("[{}] Finished extracting all entries.", m_archivePath.filename().string());
        return all_successful;
    }

} // namespace Neo4jCtl::Utils
