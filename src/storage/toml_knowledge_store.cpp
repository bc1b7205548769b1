/**
 * @file toml_knowledge_store.cpp
 * @brief TOML-backed and in-memory knowledge stores.
 * @author Dimitris Kafetzis
 *
 * Document layout:
 *
 *   version = 1
 *   saved_at = <unix micros>
 *
 *   [[patterns]]
 *   task_kind = "..."   provider_id = "..."   execution_count = N
 *   success_rate = x    avg_cpu = x  avg_ram = x  avg_duration = x
 *   sample_count = N    last_updated = <unix micros>
 *
 *   [[adaptations]]
 *   task_id = "..."  success = true  reason = "..."  details = "..."
 *   timestamp = <unix micros>
 */

#include "storage/knowledge_store.hpp"

#include <toml++/toml.hpp>

#include <fstream>
#include <system_error>

namespace adaptive_scheduler {

namespace {

constexpr int64_t SNAPSHOT_VERSION = 1;

toml::table encode_pattern(const Pattern& p) {
    return toml::table{
        {"task_kind", p.task_kind},
        {"provider_id", p.provider_id},
        {"execution_count", static_cast<int64_t>(p.execution_count)},
        {"success_rate", p.success_rate},
        {"avg_cpu", p.resource_profile.avg_cpu},
        {"avg_ram", p.resource_profile.avg_ram},
        {"avg_duration", p.resource_profile.avg_duration},
        {"sample_count", static_cast<int64_t>(p.resource_profile.sample_count)},
        {"last_updated", to_unix_micros(p.last_updated)},
    };
}

toml::table encode_adaptation(const AdaptationRecord& a) {
    return toml::table{
        {"task_id", a.task_id},
        {"success", a.success},
        {"reason", a.reason},
        {"details", a.details},
        {"timestamp", to_unix_micros(a.timestamp)},
    };
}

Pattern decode_pattern(const toml::table& t) {
    Pattern p;
    p.task_kind = t["task_kind"].value_or(std::string{});
    p.provider_id = t["provider_id"].value_or(std::string{});
    p.execution_count = static_cast<uint64_t>(t["execution_count"].value_or(int64_t{0}));
    p.success_rate = t["success_rate"].value_or(0.5);
    p.resource_profile.avg_cpu = t["avg_cpu"].value_or(0.0);
    p.resource_profile.avg_ram = t["avg_ram"].value_or(0.0);
    p.resource_profile.avg_duration = t["avg_duration"].value_or(0.0);
    p.resource_profile.sample_count =
        static_cast<uint64_t>(t["sample_count"].value_or(int64_t{0}));
    p.last_updated = from_unix_micros(t["last_updated"].value_or(int64_t{0}));
    return p;
}

AdaptationRecord decode_adaptation(const toml::table& t) {
    AdaptationRecord a;
    a.task_id = t["task_id"].value_or(std::string{});
    a.success = t["success"].value_or(false);
    a.reason = t["reason"].value_or(std::string{});
    a.details = t["details"].value_or(std::string{});
    a.timestamp = from_unix_micros(t["timestamp"].value_or(int64_t{0}));
    return a;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// TomlKnowledgeStore
// ─────────────────────────────────────────────

TomlKnowledgeStore::TomlKnowledgeStore(std::filesystem::path path)
    : path_(std::move(path)) {}

Result<KnowledgeSnapshot> TomlKnowledgeStore::load() {
    std::lock_guard lock(mutex_);

    KnowledgeSnapshot snapshot;
    if (!std::filesystem::exists(path_)) return snapshot;

    try {
        auto tbl = toml::parse_file(path_.string());

        if (auto version = tbl["version"].value_or(SNAPSHOT_VERSION); version != SNAPSHOT_VERSION) {
            return Error{"Unsupported knowledge snapshot version " + std::to_string(version)};
        }

        if (auto* patterns = tbl["patterns"].as_array()) {
            for (const auto& node : *patterns) {
                const auto* t = node.as_table();
                if (!t) continue;
                auto p = decode_pattern(*t);
                if (p.task_kind.empty() || p.provider_id.empty()) continue;
                PatternKey key{p.task_kind, p.provider_id};
                snapshot.patterns.insert_or_assign(std::move(key), std::move(p));
            }
        }

        if (auto* adaptations = tbl["adaptations"].as_array()) {
            for (const auto& node : *adaptations) {
                if (const auto* t = node.as_table()) {
                    snapshot.adaptations.push_back(decode_adaptation(*t));
                }
            }
        }
    } catch (const toml::parse_error& err) {
        return Error{"Knowledge snapshot parse error: " + std::string{err.description()}};
    }

    return snapshot;
}

Result<void> TomlKnowledgeStore::save(const KnowledgeSnapshot& snapshot) {
    std::lock_guard lock(mutex_);

    toml::array patterns;
    for (const auto& [key, p] : snapshot.patterns) patterns.push_back(encode_pattern(p));

    toml::array adaptations;
    for (const auto& a : snapshot.adaptations) adaptations.push_back(encode_adaptation(a));

    toml::table root;
    root.insert_or_assign("version", SNAPSHOT_VERSION);
    root.insert_or_assign("saved_at", to_unix_micros(std::chrono::system_clock::now()));
    root.insert_or_assign("patterns", std::move(patterns));
    root.insert_or_assign("adaptations", std::move(adaptations));

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error{"Cannot create " + path_.parent_path().string() + ": " + ec.message()};
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return Error{"Cannot open " + tmp.string() + " for writing"};
        out << root << '\n';
        out.flush();
        if (!out) return Error{"Write to " + tmp.string() + " failed"};
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        Error error{"Cannot replace " + path_.string() + ": " + ec.message()};
        std::filesystem::remove(tmp, ec);
        return error;
    }
    return {};
}

// ─────────────────────────────────────────────
// InMemoryKnowledgeStore
// ─────────────────────────────────────────────

Result<KnowledgeSnapshot> InMemoryKnowledgeStore::load() {
    std::lock_guard lock(mutex_);
    if (failing_) return Error{"in-memory knowledge store configured to fail"};
    return snapshot_;
}

Result<void> InMemoryKnowledgeStore::save(const KnowledgeSnapshot& snapshot) {
    std::lock_guard lock(mutex_);
    if (failing_) return Error{"in-memory knowledge store configured to fail"};
    snapshot_ = snapshot;
    ++saves_;
    return {};
}

void InMemoryKnowledgeStore::set_failing(bool failing) {
    std::lock_guard lock(mutex_);
    failing_ = failing;
}

uint64_t InMemoryKnowledgeStore::save_count() const {
    std::lock_guard lock(mutex_);
    return saves_;
}

}  // namespace adaptive_scheduler
