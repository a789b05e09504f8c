// src/Utils/ZipFile.cpp
#include <Neo4jCtl/Utils/ArchivePath.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>
#include <Neo4jCtl/Utils/ZipFile.hpp>

// Minizip-ng headers
extern "C" {
    #include "mz.h"
    #include "mz_zip.h"
    #include "mz_zip_rw.h"
}

namespace Neo4jCtl::Utils {

    ZipFile::ZipFile(const std::filesystem::path &archivePath)
        : m_archivePath(archivePath), m_zipReader(nullptr), m_opened(false) {
        m_logger = Logger::GetOrCreateLogger("ZipFile");
        m_zipReader = mz_zip_reader_create();
        if (!m_zipReader) {
            m_lastErrorMsg = "Failed to create zip reader instance.";
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
        }
    }

    ZipFile::~ZipFile() {
        if (m_zipReader) {
            if (m_opened) {
                mz_zip_reader_close(m_zipReader);
            }
            mz_zip_reader_delete(&m_zipReader);
            m_logger->trace("[{}] Zip reader deleted.", m_archivePath.filename().string());
        }
    }

    void ZipFile::logMzError(int32_t err, const std::string &context) {
        m_lastErrorMsg = context + ": Minizip-ng error " + std::to_string(err);
        m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
    }

    bool ZipFile::open() {
        if (!m_zipReader) {
            m_lastErrorMsg = "Zip reader was not created.";
            return false;
        }
        if (isOpen()) {
            return true;
        }

        m_logger->debug("[{}] Opening archive...", m_archivePath.filename().string());
        int32_t err = mz_zip_reader_open_file(m_zipReader, m_archivePath.string().c_str());
        if (err != MZ_OK) {
            logMzError(err, "Failed to open zip file");
            return false;
        }
        m_opened = true;
        return true;
    }

    bool ZipFile::isOpen() const { return m_opened; }

    std::string ZipFile::getLastError() const { return m_lastErrorMsg; }

    bool ZipFile::ensureDirectoryExists(const std::filesystem::path &path) {
        if (path.empty() || std::filesystem::is_directory(path)) {
            return true;
        }
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            m_lastErrorMsg = "Failed to create directory " + path.string() + ": " + ec.message();
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
            return false;
        }
        return true;
    }

    bool ZipFile::extractAll(const std::filesystem::path &outputDirectory, unsigned int stripComponents) {
        if (!open()) {
            return false;
        }

        m_logger->info("[{}] Starting extraction to: {}", m_archivePath.filename().string(), outputDirectory.string());
        if (!ensureDirectoryExists(outputDirectory)) {
            return false;
        }

        int32_t err = mz_zip_reader_goto_first_entry(m_zipReader);
        if (err != MZ_OK && err != MZ_END_OF_LIST) {
            logMzError(err, "Failed to go to first entry");
            return false;
        }

        bool all_successful = true;
        while (err == MZ_OK) {
            mz_zip_file *file_info = nullptr; // owned by the reader
            err = mz_zip_reader_entry_get_info(m_zipReader, &file_info);
            if (err != MZ_OK) {
                logMzError(err, "Failed to get entry info");
                all_successful = false;
                break;
            }

            std::string entry_name = file_info->filename ? file_info->filename : "";
            std::optional<std::filesystem::path> output_path =
                    archiveEntryDestination(outputDirectory, entry_name, stripComponents);

            if (!output_path) {
                m_logger->trace("[{}] Skipping entry: {}", m_archivePath.filename().string(), entry_name);
            } else if (mz_zip_reader_entry_is_dir(m_zipReader) == MZ_OK) {
                if (!ensureDirectoryExists(*output_path)) {
                    all_successful = false;
                }
            } else {
                if (!ensureDirectoryExists(output_path->parent_path())) {
                    all_successful = false;
                } else {
                    m_logger->trace("[{}] Extracting file to: {}", m_archivePath.filename().string(), output_path->string());
                    int32_t save_err = mz_zip_reader_entry_save_file(m_zipReader, output_path->string().c_str());
                    if (save_err != MZ_OK) {
                        logMzError(save_err, "Failed to save entry " + entry_name + " to " + output_path->string());
                        all_successful = false;
                    }
                }
            }

            err = mz_zip_reader_goto_next_entry(m_zipReader);
        }

        if (err == MZ_END_OF_LIST) {
            m_logger->debug("[{}] Finished extracting all entries.", m_archivePath.filename().string());
        } else if (err != MZ_OK) {
            logMzError(err, "An error occurred during entry traversal");
            all_successful = false;
        }

        return all_successful;
    }

} // namespace Neo4jCtl::Utils
