#include "byte_store.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

std::optional<std::string> MemoryByteStore::get(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(ns);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryByteStore::set(const std::string& ns, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[ns] = bytes;
    write_count_++;
}

void MemoryByteStore::remove(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(ns);
}

size_t MemoryByteStore::write_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_count_;
}

FileByteStore::FileByteStore(std::string directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create cache directory " + directory_ + ": " + ec.message());
    }
}

std::optional<std::string> FileByteStore::get(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream in(path_for(ns), std::ios::binary);
    if (!in) {
        return std::nullopt;
    }

    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void FileByteStore::set(const std::string& ns, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Write-then-rename so a crash never leaves a half-written payload
    auto path = path_for(ns);
    auto tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open " + tmp_path + " for writing");
        }
        out << bytes;
        if (!out) {
            throw std::runtime_error("Failed writing " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace " + path + ": " + ec.message());
    }
}

void FileByteStore::remove(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(path_for(ns), ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", path_for(ns), ec.message());
    }
}

std::string FileByteStore::path_for(const std::string& ns) const {
    return (std::filesystem::path(directory_) / (ns + ".json")).string();
}

class RedisByteStore::Impl {
public:
    Impl(const std::string& host, int port, const std::string& password, const std::string& key_prefix)
        : key_prefix_(key_prefix) {
        sw::redis::ConnectionOptions connection_opts;
        connection_opts.host = host;
        connection_opts.port = port;
        connection_opts.socket_timeout = std::chrono::milliseconds(2000);

        if (!password.empty()) {
            connection_opts.password = password;
        }

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = 2;

        redis_ = std::make_unique<sw::redis::Redis>(connection_opts, pool_opts);
        spdlog::info("Cache store connected to Redis at {}:{}", host, port);
    }

    std::optional<std::string> get(const std::string& ns) {
        auto value = redis_->get(key_prefix_ + ns);
        if (!value) {
            return std::nullopt;
        }
        return *value;
    }

    void set(const std::string& ns, const std::string& bytes) {
        redis_->set(key_prefix_ + ns, bytes);
    }

    void remove(const std::string& ns) {
        redis_->del(key_prefix_ + ns);
    }

private:
    std::string key_prefix_;
    std::unique_ptr<sw::redis::Redis> redis_;
};

RedisByteStore::RedisByteStore(const std::string& host, int port, const std::string& password,
                               const std::string& key_prefix)
    : pImpl_(std::make_unique<Impl>(host, port, password, key_prefix)) {}

RedisByteStore::~RedisByteStore() = default;

std::optional<std::string> RedisByteStore::get(const std::string& ns) {
    return pImpl_->get(ns);
}

void RedisByteStore::set(const std::string& ns, const std::string& bytes) {
    pImpl_->set(ns, bytes);
}

void RedisByteStore::remove(const std::string& ns) {
    pImpl_->remove(ns);
}
