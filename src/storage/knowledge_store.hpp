/**
 * @file knowledge_store.hpp
 * @brief Persistence for the learner's knowledge snapshot.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "storage/knowledge.hpp"

#include <filesystem>
#include <mutex>

namespace adaptive_scheduler {

class IKnowledgeStore {
public:
    virtual ~IKnowledgeStore() = default;

    /// A store that has never been saved loads as an empty snapshot.
    virtual Result<KnowledgeSnapshot> load() = 0;
    virtual Result<void> save(const KnowledgeSnapshot& snapshot) = 0;
};

/**
 * @brief Whole-document TOML snapshot.
 *
 * save() writes to "<path>.tmp" and renames it over @p path, so a crash
 * mid-write leaves the previous snapshot intact.
 */
class TomlKnowledgeStore final : public IKnowledgeStore {
public:
    explicit TomlKnowledgeStore(std::filesystem::path path);

    Result<KnowledgeSnapshot> load() override;
    Result<void> save(const KnowledgeSnapshot& snapshot) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

class InMemoryKnowledgeStore final : public IKnowledgeStore {
public:
    Result<KnowledgeSnapshot> load() override;
    Result<void> save(const KnowledgeSnapshot& snapshot) override;

    void set_failing(bool failing);
    [[nodiscard]] uint64_t save_count() const;

private:
    mutable std::mutex mutex_;
    KnowledgeSnapshot snapshot_;
    bool failing_{false};
    uint64_t saves_{0};
};

}  // namespace adaptive_scheduler
