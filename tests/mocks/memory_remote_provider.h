/**
 * @file memory_remote_provider.h
 * @brief In-memory remote provider with fault injection for tests
 */

#ifndef KCENON_TREE_TRANSFER_TESTS_MEMORY_REMOTE_PROVIDER_H
#define KCENON_TREE_TRANSFER_TESTS_MEMORY_REMOTE_PROVIDER_H

#include <kcenon/tree_transfer/provider/remote_provider.h>

#include <algorithm>
#include <cstring>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace kcenon::tree_transfer::test {

/**
 * @brief Remote provider keeping its tree in memory
 *
 * Written bytes land in the tree immediately, so a partially written file
 * is visible until it is removed. Faults are injected per path.
 */
class memory_remote_provider : public remote_provider {
public:
    /// Called after each stream operation with the path and the cumulative byte count
    using byte_callback = std::function<void(const std::string& path, uint64_t total)>;

    struct node {
        bool is_dir = false;
        std::vector<std::byte> data;
        std::optional<unix_pex> mode;
    };

    memory_remote_provider() {
        nodes_["/"] = node{true, {}, std::nullopt};
    }

    // ========================================================================
    // Tree setup and inspection
    // ========================================================================

    void add_dir(const std::string& path, std::optional<unix_pex> mode = std::nullopt) {
        nodes_[normalize(path)] = node{true, {}, mode};
    }

    void add_file(const std::string& path, const std::string& content,
                  std::optional<unix_pex> mode = std::nullopt) {
        node n{false, {}, mode};
        n.data.resize(content.size());
        std::memcpy(n.data.data(), content.data(), content.size());
        nodes_[normalize(path)] = std::move(n);
    }

    void add_file(const std::string& path, std::size_t size) {
        std::string content(size, '\0');
        for (std::size_t i = 0; i < size; ++i) {
            content[i] = static_cast<char>('a' + (i % 26));
        }
        add_file(path, content);
    }

    [[nodiscard]] auto exists(const std::string& path) const -> bool {
        return nodes_.count(normalize(path)) > 0;
    }

    [[nodiscard]] auto is_directory(const std::string& path) const -> bool {
        auto it = nodes_.find(normalize(path));
        return it != nodes_.end() && it->second.is_dir;
    }

    [[nodiscard]] auto content(const std::string& path) const -> std::string {
        auto it = nodes_.find(normalize(path));
        if (it == nodes_.end()) {
            return {};
        }
        return std::string(reinterpret_cast<const char*>(it->second.data.data()),
                           it->second.data.size());
    }

    [[nodiscard]] auto file_entry(const std::string& path) const -> fs_file {
        auto p = normalize(path);
        const auto& n = nodes_.at(p);
        return fs_file{p, std::filesystem::path(p).filename().string(), n.data.size(), n.mode, {}};
    }

    [[nodiscard]] auto dir_entry(const std::string& path) const -> fs_directory {
        auto p = normalize(path);
        const auto& n = nodes_.at(p);
        return fs_directory{p, std::filesystem::path(p).filename().string(), n.mode, {}};
    }

    [[nodiscard]] auto sent_count() const -> int { return sent_count_; }
    [[nodiscard]] auto recv_count() const -> int { return recv_count_; }

    // ========================================================================
    // Fault injection
    // ========================================================================

    void fail_connect(error err) { connect_error_ = std::move(err); }
    void set_banner(std::optional<std::string> banner) { banner_ = std::move(banner); }
    void fail_list(const std::string& path) { fail_list_.insert(normalize(path)); }
    void fail_mkdir(const std::string& path, error_code code) {
        fail_mkdir_[normalize(path)] = code;
    }
    void fail_send_file(const std::string& path) { fail_send_.insert(normalize(path)); }
    void fail_write_after(const std::string& path, uint64_t bytes) {
        fail_write_after_[normalize(path)] = bytes;
    }
    void fail_read_after(const std::string& path, uint64_t bytes) {
        fail_read_after_[normalize(path)] = bytes;
    }
    void fail_finalize(bool enable) { fail_finalize_ = enable; }
    void fail_flush(const std::string& path) { fail_flush_.insert(normalize(path)); }
    void set_max_write_chunk(std::size_t bytes) { max_write_chunk_ = bytes; }
    void on_write(byte_callback callback) { on_write_ = std::move(callback); }
    void on_read(byte_callback callback) { on_read_ = std::move(callback); }

    // ========================================================================
    // remote_provider
    // ========================================================================

    auto connect(const connection_params& /*params*/)
        -> result<std::optional<std::string>> override {
        if (connect_error_) {
            return unexpected{*connect_error_};
        }
        connected_ = true;
        return banner_;
    }

    auto disconnect() -> result<void> override {
        if (!connected_) {
            return unexpected{error{error_code::not_connected}};
        }
        connected_ = false;
        return {};
    }

    auto is_connected() const -> bool override { return connected_; }

    auto pwd() -> result<std::filesystem::path> override {
        if (!connected_) {
            return unexpected{error{error_code::not_connected}};
        }
        return std::filesystem::path(wrkdir_);
    }

    auto change_dir(const std::filesystem::path& dir) -> result<std::filesystem::path> override {
        auto p = resolve(dir);
        if (!is_directory(p)) {
            return unexpected{error{error_code::no_such_file_or_directory,
                                   "No such directory: " + p}};
        }
        wrkdir_ = p;
        return std::filesystem::path(wrkdir_);
    }

    auto list_dir(const std::filesystem::path& dir) -> result<std::vector<fs_entry>> override {
        auto p = resolve(dir);
        if (fail_list_.count(p) > 0) {
            return unexpected{error{error_code::permission_denied, "Permission denied: " + p}};
        }
        if (!is_directory(p)) {
            return unexpected{error{error_code::no_such_file_or_directory,
                                   "No such directory: " + p}};
        }
        std::vector<fs_entry> entries;
        for (const auto& [path, n] : nodes_) {
            if (path == "/" || std::filesystem::path(path).parent_path().generic_string() != p) {
                continue;
            }
            entries.push_back(to_entry(path, n));
        }
        return entries;
    }

    auto stat(const std::filesystem::path& path) -> result<fs_entry> override {
        auto p = resolve(path);
        auto it = nodes_.find(p);
        if (it == nodes_.end()) {
            return unexpected{error{error_code::no_such_file_or_directory,
                                   "No such file or directory: " + p}};
        }
        return to_entry(p, it->second);
    }

    auto mkdir(const std::filesystem::path& dir, std::optional<unix_pex> mode)
        -> result<void> override {
        auto p = resolve(dir);
        if (auto it = fail_mkdir_.find(p); it != fail_mkdir_.end()) {
            return unexpected{error{it->second, std::string(to_string(it->second)) + ": " + p}};
        }
        if (exists(p)) {
            return unexpected{error{error_code::directory_already_exists,
                                   "Directory already exists: " + p}};
        }
        nodes_[p] = node{true, {}, mode};
        return {};
    }

    auto remove(const fs_entry& entry) -> result<void> override {
        auto p = resolve(get_abs_path(entry));
        if (!exists(p)) {
            return unexpected{error{error_code::no_such_file_or_directory,
                                   "No such file or directory: " + p}};
        }
        for (auto it = nodes_.begin(); it != nodes_.end();) {
            if (it->first == p || it->first.rfind(p + "/", 0) == 0) {
                it = nodes_.erase(it);
            } else {
                ++it;
            }
        }
        return {};
    }

    auto send_file(const fs_file& local_file, const std::filesystem::path& remote_path)
        -> result<std::unique_ptr<writable_stream>> override {
        auto p = resolve(remote_path);
        if (fail_send_.count(p) > 0) {
            return unexpected{error{error_code::permission_denied, "Permission denied: " + p}};
        }
        nodes_[p] = node{false, {}, local_file.mode};
        return std::unique_ptr<writable_stream>(std::make_unique<write_stream>(*this, p));
    }

    auto recv_file(const fs_file& remote_file)
        -> result<std::unique_ptr<readable_stream>> override {
        auto p = resolve(remote_file.abs_path);
        auto it = nodes_.find(p);
        if (it == nodes_.end() || it->second.is_dir) {
            return unexpected{error{error_code::no_such_file_or_directory,
                                   "No such file: " + p}};
        }
        return std::unique_ptr<readable_stream>(
            std::make_unique<read_stream>(*this, p, it->second.data));
    }

    auto on_sent(std::unique_ptr<writable_stream> /*stream*/) -> result<void> override {
        ++sent_count_;
        if (fail_finalize_) {
            return unexpected{error{error_code::io_error, "commit refused"}};
        }
        return {};
    }

    auto on_recv(std::unique_ptr<readable_stream> /*stream*/) -> result<void> override {
        ++recv_count_;
        if (fail_finalize_) {
            return unexpected{error{error_code::io_error, "close refused"}};
        }
        return {};
    }

    auto protocol_name() const -> std::string_view override { return "memory"; }

private:
    class write_stream : public writable_stream {
    public:
        write_stream(memory_remote_provider& owner, std::string path)
            : owner_(owner), path_(std::move(path)) {}

        auto write(std::span<const std::byte> data) -> result<std::size_t> override {
            auto limit = owner_.fail_write_after_.find(path_);
            if (limit != owner_.fail_write_after_.end() && written_ >= limit->second) {
                return unexpected{error{error_code::io_error, "Broken pipe"}};
            }
            auto it = owner_.nodes_.find(path_);
            if (it == owner_.nodes_.end()) {
                return unexpected{error{error_code::stream_closed, "File vanished: " + path_}};
            }
            auto count = data.size();
            if (owner_.max_write_chunk_ > 0) {
                count = std::min(count, owner_.max_write_chunk_);
            }
            it->second.data.insert(it->second.data.end(), data.begin(),
                                   data.begin() + static_cast<std::ptrdiff_t>(count));
            written_ += count;
            if (owner_.on_write_) {
                owner_.on_write_(path_, written_);
            }
            return count;
        }

        auto flush() -> result<void> override {
            if (owner_.fail_flush_.count(path_) > 0) {
                return unexpected{error{error_code::io_error, "No space left on device"}};
            }
            return {};
        }

    private:
        memory_remote_provider& owner_;
        std::string path_;
        uint64_t written_ = 0;
    };

    class read_stream : public readable_stream {
    public:
        read_stream(memory_remote_provider& owner, std::string path, std::vector<std::byte> data)
            : owner_(owner), path_(std::move(path)), data_(std::move(data)) {}

        auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
            auto limit = owner_.fail_read_after_.find(path_);
            if (limit != owner_.fail_read_after_.end() && position_ >= limit->second) {
                return unexpected{error{error_code::io_error, "Connection reset"}};
            }
            auto count = std::min<std::size_t>(buffer.size(), data_.size() - position_);
            std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_), count,
                        buffer.begin());
            position_ += count;
            if (count > 0 && owner_.on_read_) {
                owner_.on_read_(path_, position_);
            }
            return count;
        }

        auto seek(int64_t offset, seek_origin origin) -> result<uint64_t> override {
            int64_t base = 0;
            if (origin == seek_origin::current) {
                base = static_cast<int64_t>(position_);
            } else if (origin == seek_origin::end) {
                base = static_cast<int64_t>(data_.size());
            }
            auto target = base + offset;
            if (target < 0 || target > static_cast<int64_t>(data_.size())) {
                return unexpected{error{error_code::seek_error, "Invalid seek"}};
            }
            position_ = static_cast<std::size_t>(target);
            return static_cast<uint64_t>(position_);
        }

    private:
        memory_remote_provider& owner_;
        std::string path_;
        std::vector<std::byte> data_;
        std::size_t position_ = 0;
    };

    [[nodiscard]] static auto normalize(const std::filesystem::path& path) -> std::string {
        auto p = std::filesystem::path("/") / path.relative_path();
        auto s = p.lexically_normal().generic_string();
        if (s.size() > 1 && s.back() == '/') {
            s.pop_back();
        }
        return s;
    }

    [[nodiscard]] auto resolve(const std::filesystem::path& path) const -> std::string {
        if (path.is_absolute()) {
            return normalize(path);
        }
        return normalize(std::filesystem::path(wrkdir_) / path);
    }

    [[nodiscard]] static auto to_entry(const std::string& path, const node& n) -> fs_entry {
        auto name = std::filesystem::path(path).filename().string();
        if (n.is_dir) {
            return fs_directory{path, name, n.mode, {}};
        }
        return fs_file{path, name, n.data.size(), n.mode, {}};
    }

    std::map<std::string, node> nodes_;
    std::string wrkdir_ = "/";
    bool connected_ = false;

    std::optional<error> connect_error_;
    std::optional<std::string> banner_ = std::string("memory endpoint ready");
    std::set<std::string> fail_list_;
    std::map<std::string, error_code> fail_mkdir_;
    std::set<std::string> fail_send_;
    std::map<std::string, uint64_t> fail_write_after_;
    std::map<std::string, uint64_t> fail_read_after_;
    bool fail_finalize_ = false;
    std::set<std::string> fail_flush_;
    std::size_t max_write_chunk_ = 0;
    byte_callback on_write_;
    byte_callback on_read_;
    int sent_count_ = 0;
    int recv_count_ = 0;
};

}  // namespace kcenon::tree_transfer::test

#endif  // KCENON_TREE_TRANSFER_TESTS_MEMORY_REMOTE_PROVIDER_H
