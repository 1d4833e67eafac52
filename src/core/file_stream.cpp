/**
 * @file file_stream.cpp
 * @brief File-backed stream implementations
 */

#include "kcenon/tree_transfer/core/io_stream.h"

#include <ios>
#include <system_error>

namespace kcenon::tree_transfer {

namespace {

auto to_seekdir(seek_origin origin) -> std::ios_base::seekdir {
    switch (origin) {
        case seek_origin::begin: return std::ios_base::beg;
        case seek_origin::current: return std::ios_base::cur;
        case seek_origin::end: return std::ios_base::end;
        default: return std::ios_base::beg;
    }
}

auto open_error(const std::filesystem::path& path) -> error {
    std::error_code ec;
    if (!std::filesystem::exists(path.parent_path().empty() ? "." : path.parent_path(), ec)) {
        return error{error_code::no_such_file_or_directory,
                     "No such file or directory: " + path.string()};
    }
    if (std::filesystem::is_directory(path, ec)) {
        return error{error_code::is_a_directory, "Is a directory: " + path.string()};
    }
    return error{error_code::permission_denied, "Cannot open file: " + path.string()};
}

}  // namespace

// file_read_stream

file_read_stream::file_read_stream(std::ifstream stream, std::filesystem::path path)
    : stream_(std::move(stream)), path_(std::move(path)) {}

auto file_read_stream::open(const std::filesystem::path& path)
    -> result<std::unique_ptr<file_read_stream>> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected{error{error_code::no_such_file_or_directory,
                               "No such file or directory: " + path.string()}};
    }
    if (std::filesystem::is_directory(path, ec)) {
        return unexpected{error{error_code::is_a_directory, "Is a directory: " + path.string()}};
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return unexpected{open_error(path)};
    }
    return std::unique_ptr<file_read_stream>(new file_read_stream(std::move(stream), path));
}

auto file_read_stream::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (buffer.empty()) {
        return std::size_t{0};
    }
    stream_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(buffer.size()));
    auto count = stream_.gcount();
    if (stream_.bad()) {
        return unexpected{error{error_code::file_read_error,
                               "Failed to read from " + path_.string()}};
    }
    if (stream_.eof()) {
        // Short read at end of file; later reads return 0
        stream_.clear(std::ios::eofbit);
    }
    return static_cast<std::size_t>(count);
}

auto file_read_stream::seek(int64_t offset, seek_origin origin) -> result<uint64_t> {
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), to_seekdir(origin));
    if (stream_.fail()) {
        stream_.clear();
        return unexpected{error{error_code::seek_error, "Failed to seek " + path_.string()}};
    }
    auto pos = stream_.tellg();
    if (pos < 0) {
        return unexpected{error{error_code::seek_error,
                               "Failed to query position of " + path_.string()}};
    }
    return static_cast<uint64_t>(pos);
}

// file_write_stream

file_write_stream::file_write_stream(std::ofstream stream, std::filesystem::path path)
    : stream_(std::move(stream)), path_(std::move(path)) {}

auto file_write_stream::create(const std::filesystem::path& path)
    -> result<std::unique_ptr<file_write_stream>> {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return unexpected{error{error_code::is_a_directory, "Is a directory: " + path.string()}};
    }

    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream) {
        return unexpected{open_error(path)};
    }
    return std::unique_ptr<file_write_stream>(new file_write_stream(std::move(stream), path));
}

auto file_write_stream::write(std::span<const std::byte> data) -> result<std::size_t> {
    stream_.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    if (!stream_) {
        return unexpected{error{error_code::file_write_error,
                               "Failed to write to " + path_.string()}};
    }
    return data.size();
}

auto file_write_stream::flush() -> result<void> {
    stream_.flush();
    if (!stream_) {
        return unexpected{error{error_code::file_write_error,
                               "Failed to flush " + path_.string()}};
    }
    return {};
}

}  // namespace kcenon::tree_transfer
