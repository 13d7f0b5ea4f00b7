/**
 * @file DocxPackage.cpp
 * @brief Implementation of DocxPackage.
 */

#include "infrastructure/docx/DocxPackage.hpp"

#include <cstring>
#include <miniz.h>

namespace docforge::infrastructure::docx {

namespace {

class ZipWriter {
public:
    ZipWriter() { std::memset(&m_archive, 0, sizeof(m_archive)); }
    ~ZipWriter() { close(); }

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    bool open() {
        m_open = mz_zip_writer_init_heap(&m_archive, 0, 0) != 0;
        return m_open;
    }

    bool add(const std::string& name, const std::string& data) {
        return mz_zip_writer_add_mem(&m_archive, name.c_str(), data.data(), data.size(),
                                     MZ_DEFAULT_COMPRESSION) != 0;
    }

    bool finish(std::string& out) {
        void* buffer = nullptr;
        size_t size = 0;
        if (!mz_zip_writer_finalize_heap_archive(&m_archive, &buffer, &size)) {
            return false;
        }
        out.assign(static_cast<const char*>(buffer), size);
        mz_free(buffer);
        return true;
    }

    std::string lastError() {
        return mz_zip_get_error_string(mz_zip_get_last_error(&m_archive));
    }

private:
    void close() {
        if (m_open) {
            mz_zip_writer_end(&m_archive);
            m_open = false;
        }
    }

    mz_zip_archive m_archive;
    bool m_open = false;
};

} // namespace

void DocxPackage::addPart(const std::string& name, std::string data) {
    for (auto& part : m_parts) {
        if (part.first == name) {
            part.second = std::move(data);
            return;
        }
    }
    m_parts.emplace_back(name, std::move(data));
}

bool DocxPackage::hasPart(const std::string& name) const {
    for (const auto& part : m_parts) {
        if (part.first == name) return true;
    }
    return false;
}

bool DocxPackage::build(std::string& archive, std::string& error) const {
    ZipWriter writer;
    if (!writer.open()) {
        error = "Could not initialize zip writer";
        return false;
    }
    for (const auto& part : m_parts) {
        if (!writer.add(part.first, part.second)) {
            error = "Could not add " + part.first + ": " + writer.lastError();
            return false;
        }
    }
    if (!writer.finish(archive)) {
        error = "Could not finalize archive: " + writer.lastError();
        return false;
    }
    return true;
}

} // namespace docforge::infrastructure::docx
