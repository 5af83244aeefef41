#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <mutex>
#include "application/BasePathResolver.hpp"
#include "application/ProjectProvisioningService.hpp"
#include "domain/ProjectLayout.hpp"
#include "infrastructure/JsonSettingsStore.hpp"
#include "infrastructure/LocalFileSystem.hpp"
#include "test/support/TestSupport.hpp"

using namespace fieldtrack;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting Provisioning Concurrency Test..." << std::endl;

    test::ScratchDirectory scratch("concurrency");
    fs::path base = scratch.path() / "base";
    fs::create_directories(base);

    auto store = std::make_shared<infrastructure::JsonSettingsStore>(scratch.path() / "settings.json", true);
    auto resolver = std::make_shared<application::BasePathResolver>(store, scratch.path() / "default");
    auto fileSystem = std::make_shared<infrastructure::LocalFileSystem>();

    // Several tenants configure their base path at the same time through one store.
    const int NUM_TENANTS = 8;
    std::vector<std::thread> writers;
    for (int i = 0; i < NUM_TENANTS; ++i) {
        writers.emplace_back([&store, &base, i]() {
            store->writeSetting(domain::kWorkflowBasePathKey, base.string(), std::to_string(i));
        });
    }
    for (auto& t : writers) {
        if (t.joinable()) t.join();
    }
    for (int i = 0; i < NUM_TENANTS; ++i) {
        assert(resolver->resolveEffectiveBasePath(std::to_string(i)) == base.string());
    }
    std::cout << "[PASS] Concurrent settings writes all persisted." << std::endl;

    domain::VerificationPolicy policy;
    policy.local = {2, std::chrono::milliseconds(5)};
    application::ProjectProvisioningService service(resolver, fileSystem, policy);

    // Stress: many requests for the same project, racing on every mkdir.
    const int NUM_REQUESTS = 24;
    std::vector<std::thread> threads;
    std::vector<domain::ProvisioningResult> results(NUM_REQUESTS);
    std::atomic<int> completed{0};

    std::cout << "[Test] Spawning " << NUM_REQUESTS << " threads provisioning the same project..." << std::endl;

    for (int i = 0; i < NUM_REQUESTS; ++i) {
        threads.emplace_back([&service, &results, &completed, i]() {
            results[i] = service.provisionProjectDirectory(std::to_string(i % NUM_TENANTS), "02-2026-0019");
            completed++;
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    assert(completed == NUM_REQUESTS);

    int rootsCreated = 0;
    std::vector<int> subdirsCreated(domain::ProjectSubdirectories().size(), 0);
    for (const auto& result : results) {
        assert(result.success);
        assert(result.warnings.empty());
        assert(result.path == (base / "02-2026-0019").string());
        assert(result.subdirectories.size() == subdirsCreated.size());
        if (result.created) ++rootsCreated;
        for (size_t s = 0; s < result.subdirectories.size(); ++s) {
            assert(result.subdirectories[s].success);
            if (result.subdirectories[s].created) ++subdirsCreated[s];
        }
    }

    // mkdir is atomic: exactly one request can claim each directory.
    assert(rootsCreated == 1);
    for (int count : subdirsCreated) {
        assert(count == 1);
    }

    // Only the project root and its subdirectories remain; every probe file is gone.
    int entries = 0;
    for (const auto& entry : fs::directory_iterator(base / "02-2026-0019")) {
        assert(entry.is_directory());
        ++entries;
    }
    assert(entries == static_cast<int>(domain::ProjectSubdirectories().size()));
    for (const auto& entry : fs::directory_iterator(base)) {
        assert(entry.path().filename() == "02-2026-0019");
    }

    std::cout << "[PASS] Provisioning Concurrency Test." << std::endl;
    return 0;
}
