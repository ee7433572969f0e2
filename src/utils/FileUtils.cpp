/**
 * FileUtils.cpp
 *
 * File system helpers and positioned writes.
 */

#include "FileUtils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace bulkfetch::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::createSized(const fs::path& path, uint64_t size) {
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) return false;
    }
    std::error_code ec;
    fs::resize_file(path, size, ec);
    return !ec;
}

// -- PositionedFile --

PositionedFile::PositionedFile(const fs::path& path) : m_path(path) {
#ifdef _WIN32
    HANDLE handle = CreateFileW(path.wstring().c_str(), GENERIC_WRITE,
                                FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr,
                                OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        m_error = "CreateFile failed: " + std::to_string(GetLastError());
    } else {
        m_handle = handle;
    }
#else
    m_fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (m_fd < 0) {
        m_error = std::strerror(errno);
    }
#endif
}

PositionedFile::~PositionedFile() { close(); }

bool PositionedFile::isOpen() const {
#ifdef _WIN32
    return m_handle != nullptr;
#else
    return m_fd >= 0;
#endif
}

bool PositionedFile::writeAt(uint64_t offset, const char* data, size_t size) {
    if (!isOpen()) {
        if (m_error.empty()) m_error = "file not open";
        return false;
    }

    while (size > 0) {
#ifdef _WIN32
        OVERLAPPED ov{};
        ov.Offset = static_cast<DWORD>(offset & 0xFFFFFFFFull);
        ov.OffsetHigh = static_cast<DWORD>(offset >> 32);
        DWORD toWrite = size > 0x40000000 ? 0x40000000 : static_cast<DWORD>(size);
        DWORD written = 0;
        if (!WriteFile(static_cast<HANDLE>(m_handle), data, toWrite, &written, &ov)) {
            m_error = "WriteFile failed: " + std::to_string(GetLastError());
            return false;
        }
#else
        ssize_t written = ::pwrite(m_fd, data, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) continue;
            m_error = std::strerror(errno);
            return false;
        }
#endif
        if (written == 0) {
            m_error = "short write";
            return false;
        }
        data += written;
        size -= static_cast<size_t>(written);
        offset += static_cast<uint64_t>(written);
    }
    return true;
}

void PositionedFile::close() {
#ifdef _WIN32
    if (m_handle) { CloseHandle(static_cast<HANDLE>(m_handle)); m_handle = nullptr; }
#else
    if (m_fd >= 0) { ::close(m_fd); m_fd = -1; }
#endif
}

} // namespace bulkfetch::utils
