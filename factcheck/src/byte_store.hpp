#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Durable key-value storage for serialized payloads, addressed by namespace.
class ByteStore {
public:
    virtual ~ByteStore() = default;

    virtual std::optional<std::string> get(const std::string& ns) = 0;
    virtual void set(const std::string& ns, const std::string& bytes) = 0;
    virtual void remove(const std::string& ns) = 0;
};

class MemoryByteStore : public ByteStore {
public:
    std::optional<std::string> get(const std::string& ns) override;
    void set(const std::string& ns, const std::string& bytes) override;
    void remove(const std::string& ns) override;

    size_t write_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> data_;
    size_t write_count_ = 0;
};

// One file per namespace under a directory
class FileByteStore : public ByteStore {
public:
    explicit FileByteStore(std::string directory);

    std::optional<std::string> get(const std::string& ns) override;
    void set(const std::string& ns, const std::string& bytes) override;
    void remove(const std::string& ns) override;

private:
    std::string path_for(const std::string& ns) const;

    std::string directory_;
    std::mutex mutex_;
};

// One Redis string key per namespace
class RedisByteStore : public ByteStore {
public:
    RedisByteStore(const std::string& host, int port, const std::string& password,
                   const std::string& key_prefix);
    ~RedisByteStore() override;

    std::optional<std::string> get(const std::string& ns) override;
    void set(const std::string& ns, const std::string& bytes) override;
    void remove(const std::string& ns) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
