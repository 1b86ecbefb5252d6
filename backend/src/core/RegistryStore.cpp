/*
src/core/RegistryStore.cpp
Snapshot persistence for the device registry.
*/
#include "core/RegistryStore.hpp"
#include "core/ErrorCatalog.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace ipscout {

JsonFileStore::JsonFileStore(std::string path) : path_(std::move(path)) {}

RegistrySnapshot JsonFileStore::load() {
    std::error_code fec;
    if (!std::filesystem::exists(path_, fec)) {
        std::cerr << "DeviceRegistry: no database at " << path_ << "; starting empty" << std::endl;
        return {};
    }
    std::ifstream f(path_);
    if (!f) {
        std::cerr << "DeviceRegistry: could not open " << path_ << "; starting empty" << std::endl;
        return {};
    }
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "DeviceRegistry: could not parse " << path_ << "; starting empty" << std::endl;
        return {};
    }
    return snapshot_from_json(j);
}

void JsonFileStore::save(const RegistrySnapshot& snapshot) {
    std::filesystem::path target(path_);
    std::filesystem::path tmp(path_ + ".tmp");

    // encode before touching disk so a bad record leaves no tmp file behind
    std::string text;
    try {
        text = snapshot_to_json(snapshot).dump(2);
    } catch (const json::exception& e) {
        throw Error(ErrorKind::PersistenceFailure, std::string(errors::D2500_ENCODE_FAILED) + ": " + e.what());
    }

    std::error_code fec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), fec);
        if (fec) throw Error(ErrorKind::PersistenceFailure, std::string(errors::D2500_OPEN_FAILED) + ": " + fec.message());
    }

    {
        std::ofstream f(tmp, std::ios::out | std::ios::trunc);
        if (!f) throw Error(ErrorKind::PersistenceFailure, std::string(errors::D2500_OPEN_FAILED) + ": " + tmp.string());
        f << text << "\n";
        f.flush();
        if (!f) {
            f.close();
            std::filesystem::remove(tmp, fec);
            throw Error(ErrorKind::PersistenceFailure, std::string(errors::D2500_WRITE_FAILED) + ": " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, target, fec);
    if (fec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw Error(ErrorKind::PersistenceFailure, std::string(errors::D2500_RENAME_FAILED) + ": " + fec.message());
    }
}

RegistrySnapshot MemoryStore::load() {
    std::lock_guard<std::mutex> lk(m_);
    return saved_;
}

void MemoryStore::save(const RegistrySnapshot& snapshot) {
    std::lock_guard<std::mutex> lk(m_);
    if (fail_saves_) throw Error(ErrorKind::PersistenceFailure, "memory store configured to fail");
    saved_ = snapshot;
    save_count_ += 1;
}

void MemoryStore::set_fail_saves(bool fail) {
    std::lock_guard<std::mutex> lk(m_);
    fail_saves_ = fail;
}

int MemoryStore::save_count() const {
    std::lock_guard<std::mutex> lk(m_);
    return save_count_;
}

RegistrySnapshot MemoryStore::saved() const {
    std::lock_guard<std::mutex> lk(m_);
    return saved_;
}

} // namespace ipscout
