/**
 * @file io_stream.h
 * @brief Byte stream abstractions used by the transfer engine
 *
 * Providers hand out readable and writable streams; the engine only ever
 * sees these interfaces. File-backed implementations are provided for the
 * local side and for providers that store data on the local disk.
 */

#ifndef KCENON_TREE_TRANSFER_CORE_IO_STREAM_H
#define KCENON_TREE_TRANSFER_CORE_IO_STREAM_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>

#include "kcenon/tree_transfer/core/types.h"

namespace kcenon::tree_transfer {

/**
 * @brief Origin for seek operations
 */
enum class seek_origin {
    begin,
    current,
    end
};

/**
 * @brief Source of bytes
 */
class readable_stream {
public:
    virtual ~readable_stream() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Number of bytes read, 0 at end of stream
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief Reposition the stream
     * @return New absolute position
     */
    [[nodiscard]] virtual auto seek(int64_t offset, seek_origin origin) -> result<uint64_t> = 0;
};

/**
 * @brief Sink for bytes
 */
class writable_stream {
public:
    virtual ~writable_stream() = default;

    /**
     * @brief Write some of the bytes in data
     * @return Number of bytes accepted; may be less than data.size()
     */
    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<std::size_t> = 0;

    [[nodiscard]] virtual auto flush() -> result<void> = 0;
};

/**
 * @brief readable_stream over a file on the local disk
 */
class file_read_stream final : public readable_stream {
public:
    /**
     * @brief Open a file for reading
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::unique_ptr<file_read_stream>>;

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto seek(int64_t offset, seek_origin origin) -> result<uint64_t> override;

private:
    explicit file_read_stream(std::ifstream stream, std::filesystem::path path);

    std::ifstream stream_;
    std::filesystem::path path_;
};

/**
 * @brief writable_stream over a file on the local disk (truncates)
 */
class file_write_stream final : public writable_stream {
public:
    [[nodiscard]] static auto create(const std::filesystem::path& path)
        -> result<std::unique_ptr<file_write_stream>>;

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<std::size_t> override;
    [[nodiscard]] auto flush() -> result<void> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    explicit file_write_stream(std::ofstream stream, std::filesystem::path path);

    std::ofstream stream_;
    std::filesystem::path path_;
};

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_CORE_IO_STREAM_H
