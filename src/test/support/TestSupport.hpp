/**
 * @file TestSupport.hpp
 * @brief Scratch directories, an in-memory settings store and fault-injecting filesystems for tests.
 */

#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "domain/SettingsStore.hpp"
#include "infrastructure/LocalFileSystem.hpp"
#include "infrastructure/PathValidator.hpp"

namespace fieldtrack::test {

namespace fs = std::filesystem;

/**
 * @class ScratchDirectory
 * @brief Unique directory under the system temp dir, removed on destruction.
 */
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& label) {
        m_path = fs::temp_directory_path() / infrastructure::PathValidator::MakeUniqueName("fieldtrack_" + label);
        fs::create_directories(m_path);
    }

    ~ScratchDirectory() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const fs::path& path() const { return m_path; }
    std::string str() const { return m_path.string(); }

private:
    fs::path m_path;
};

/**
 * @class MemorySettingsStore
 * @brief Map-backed settings store; can be told to fail every read.
 */
class MemorySettingsStore : public domain::SettingsStore {
public:
    explicit MemorySettingsStore(bool tenantPartitioned = true) : m_tenantPartitioned(tenantPartitioned) {}

    std::optional<std::string> readSetting(const std::string& key,
                                           const std::optional<domain::TenantId>& tenant) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_reads;
        m_lastQualifier = tenant;
        if (m_failReads) {
            throw std::runtime_error("settings store unreachable");
        }
        auto it = m_values.find({tenant.value_or(""), key});
        if (it == m_values.end()) return std::nullopt;
        return it->second;
    }

    void writeSetting(const std::string& key,
                      const std::optional<std::string>& value,
                      const std::optional<domain::TenantId>& tenant) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (value) {
            m_values[{tenant.value_or(""), key}] = *value;
        } else {
            m_values.erase({tenant.value_or(""), key});
        }
    }

    bool isTenantPartitioned() const override { return m_tenantPartitioned; }

    /** @brief Seeds the base path; an empty tenant means the global value. */
    void setBasePath(const std::string& tenant, const std::string& value) {
        writeSetting(domain::kWorkflowBasePathKey, value,
                     tenant.empty() ? std::nullopt : std::optional<domain::TenantId>(tenant));
    }

    void failReads(bool fail) { m_failReads = fail; }
    int reads() const { return m_reads; }
    std::optional<domain::TenantId> lastQualifier() const { return m_lastQualifier; }

private:
    bool m_tenantPartitioned;
    bool m_failReads = false;
    int m_reads = 0;
    std::optional<domain::TenantId> m_lastQualifier;
    std::map<std::pair<std::string, std::string>, std::string> m_values;
    mutable std::mutex m_mutex;
};

/**
 * @class LaggingFileSystem
 * @brief Real filesystem whose freshly created directories stay invisible for a number of checks.
 *
 * Models a sync client that acknowledges a create before the entry shows up locally.
 * A negative lag keeps new directories hidden for good.
 */
class LaggingFileSystem : public infrastructure::LocalFileSystem {
public:
    explicit LaggingFileSystem(int hiddenChecks) : m_hiddenChecks(hiddenChecks) {}

    bool exists(const fs::path& path) override {
        if (isHidden(path, false)) return false;
        return LocalFileSystem::exists(path);
    }

    bool isDirectory(const fs::path& path) override {
        if (isHidden(path, true)) return false;
        return LocalFileSystem::isDirectory(path);
    }

    bool createDirectories(const fs::path& path) override {
        bool created = LocalFileSystem::createDirectories(path);
        if (created) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_pending[path.lexically_normal().string()] = m_hiddenChecks;
        }
        return created;
    }

    int directoryChecks() const { return m_directoryChecks; }

private:
    bool isHidden(const fs::path& path, bool countCheck) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (countCheck) ++m_directoryChecks;
        auto it = m_pending.find(path.lexically_normal().string());
        if (it == m_pending.end()) return false;
        if (it->second < 0) return true;
        if (it->second == 0) {
            m_pending.erase(it);
            return false;
        }
        if (countCheck) --it->second;
        return true;
    }

    int m_hiddenChecks;
    int m_directoryChecks = 0;
    std::map<std::string, int> m_pending;
    std::mutex m_mutex;
};

/**
 * @class FaultyFileSystem
 * @brief Real filesystem with injectable failures.
 */
class FaultyFileSystem : public infrastructure::LocalFileSystem {
public:
    /** @brief Probe files can never be created below this directory. */
    void denyWritesUnder(const fs::path& directory) {
        m_readOnlyRoots.insert(directory.lexically_normal().string());
    }

    /** @brief Creating a directory with this final name fails. */
    void failCreationOf(const std::string& name) {
        m_failingNames.insert(name);
    }

    bool createDirectories(const fs::path& path) override {
        if (m_failingNames.count(path.filename().string())) {
            throw fs::filesystem_error("Injected creation failure", path,
                                       std::make_error_code(std::errc::permission_denied));
        }
        return LocalFileSystem::createDirectories(path);
    }

    void createEmptyFile(const fs::path& path) override {
        std::string parent = path.parent_path().lexically_normal().string();
        for (const auto& root : m_readOnlyRoots) {
            if (parent.rfind(root, 0) == 0) {
                throw fs::filesystem_error("Injected write failure", path,
                                           std::make_error_code(std::errc::read_only_file_system));
            }
        }
        LocalFileSystem::createEmptyFile(path);
    }

private:
    std::set<std::string> m_readOnlyRoots;
    std::set<std::string> m_failingNames;
};

} // namespace fieldtrack::test
