#pragma once
#include <mutex>
#include <string>
#include "DeviceRecord.hpp"

namespace ipscout {

// Durable backing for DeviceRegistry. save() must be all-or-nothing and
// throw Error(PersistenceFailure) when the snapshot was not written.
class RegistryStore {
public:
    virtual ~RegistryStore() = default;
    virtual RegistrySnapshot load() = 0;
    virtual void save(const RegistrySnapshot& snapshot) = 0;
    virtual std::string describe() const = 0;
};

// Pretty-printed JSON object keyed by hardware address. Writes land in
// "<path>.tmp" and are renamed over the target.
class JsonFileStore : public RegistryStore {
public:
    explicit JsonFileStore(std::string path);

    RegistrySnapshot load() override;
    void save(const RegistrySnapshot& snapshot) override;
    std::string describe() const override { return path_; }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Keeps the last saved snapshot in memory. Used by tests and by one-shot
// commands that must not touch disk.
class MemoryStore : public RegistryStore {
public:
    MemoryStore() = default;
    explicit MemoryStore(RegistrySnapshot initial) : saved_(std::move(initial)) {}

    RegistrySnapshot load() override;
    void save(const RegistrySnapshot& snapshot) override;
    std::string describe() const override { return "memory"; }

    void set_fail_saves(bool fail);
    int save_count() const;
    RegistrySnapshot saved() const;

private:
    mutable std::mutex m_;
    RegistrySnapshot saved_;
    bool fail_saves_ = false;
    int save_count_ = 0;
};

} // namespace ipscout
