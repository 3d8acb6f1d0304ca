// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_FILEHANDLE_HXX
#define SIHOA_FILEHANDLE_HXX
#include <cstdio>
#include <string>

// RAII wrapper for FILE handle
class FileHandle {
public:
    FileHandle() = default;
    explicit FileHandle(const char* path, const char* mode) {
        m_file = fopen(path, mode);
    }

    ~FileHandle() {
        close();
    }

    bool reopen(const char* path, const char* mode) {
        close();
        m_file = fopen(path, mode);
        return m_file != nullptr;
    }

    void close() {
        if (m_file) {
            fclose(m_file);
            m_file = nullptr;
        }
    }

    /**
     * @brief Read the remaining content of the file into a string.
     */
    [[nodiscard]] bool readAll(std::string& out) const {
        if (!m_file) return false;
        out.clear();
        char buf[4096];
        size_t n = 0;
        while ((n = fread(buf, 1, sizeof(buf), m_file)) > 0) {
            out.append(buf, n);
        }
        return ferror(m_file) == 0;
    }

    [[nodiscard]] FILE* get() const { return m_file; }
    explicit operator bool() const { return m_file != nullptr; }

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
private:
    FILE* m_file{nullptr};
};
#endif //SIHOA_FILEHANDLE_HXX
