#pragma once
#include "multimcp/config.hpp"
#include "multimcp/types.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace multimcp
{

/// Persisted record of a launched server, shared by every orchestrator
/// instance of the same user
struct RegistryEntry
{
    std::string server_name;
    int pid{0};
    std::string start_time; ///< ISO-8601 local time
    std::string process_token; ///< process::start_token at launch, empty if unknown
    std::string config_hash;
    std::string log_dir;
    std::string stdout_log;
    std::string stderr_log;
};

void to_json(Json& j, const RegistryEntry& e);
void from_json(const Json& j, RegistryEntry& e);

/// File-backed name -> RegistryEntry table.
///
/// Mutations are read-modify-write cycles under an advisory lock on
/// `<file>.lock`, and the table is replaced through `<file>.tmp` + rename,
/// so concurrent orchestrators never observe a torn file.
class Registry
{
  public:
    explicit Registry(std::filesystem::path file);

    const std::filesystem::path& file() const
    {
        return file_;
    }

    /// Whole table; missing or unreadable file yields an empty table
    std::map<std::string, RegistryEntry> load() const;

    /// Replace the whole table
    void save(const std::map<std::string, RegistryEntry>& entries) const;

    void put(const RegistryEntry& entry);
    void remove(const std::string& name);

    std::optional<RegistryEntry> get(const std::string& name) const;

    std::map<std::string, RegistryEntry> entries() const
    {
        return load();
    }

    /// Pid of the recorded server if it is still alive. A dead entry is
    /// removed from the file as a side effect.
    std::optional<int> probe(const std::string& name);

    /// The recorded pid is running and, where start times are known, is
    /// still the process that was launched
    static bool is_alive(const RegistryEntry& entry);

  private:
    std::map<std::string, RegistryEntry> load_unlocked() const;
    void save_unlocked(const std::map<std::string, RegistryEntry>& entries) const;

    std::filesystem::path file_;
};

/// Hex SHA-256 of the key-sorted JSON dump of a declared config
std::string fingerprint(const ServerConfig& config);

} // namespace multimcp
