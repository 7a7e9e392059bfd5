#include "multimcp/registry.hpp"

#include "internal/process.hpp"
#include "multimcp/exceptions.hpp"
#include "multimcp/logging.hpp"

#include <fstream>
#include <iomanip>
#include <mutex>
#include <openssl/evp.h>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace multimcp
{

namespace
{
/// Exclusive advisory lock on a sidecar file, held for the object's lifetime
class FileLock
{
  public:
    explicit FileLock(const std::filesystem::path& path)
    {
#ifdef _WIN32
        handle_ = CreateFileW(path.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                              FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                              OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle_ == INVALID_HANDLE_VALUE)
            throw Error("cannot open registry lock " + path.string() + ": error " +
                        std::to_string(GetLastError()));
        OVERLAPPED ov{};
        if (!LockFileEx(handle_, LOCKFILE_EXCLUSIVE_LOCK, 0, MAXDWORD, MAXDWORD, &ov))
        {
            DWORD err = GetLastError();
            CloseHandle(handle_);
            throw Error("cannot lock registry: error " + std::to_string(err));
        }
#else
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0)
            throw Error("cannot open registry lock " + path.string() + ": " +
                        std::strerror(errno));
        struct flock fl
        {
        };
        fl.l_type = F_WRLCK;
        fl.l_whence = SEEK_SET;
        int rc;
        do
        {
            rc = ::fcntl(fd_, F_SETLKW, &fl);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0)
        {
            int err = errno;
            ::close(fd_);
            throw Error(std::string("cannot lock registry: ") + std::strerror(err));
        }
#endif
    }

    ~FileLock()
    {
#ifdef _WIN32
        OVERLAPPED ov{};
        UnlockFileEx(handle_, 0, MAXDWORD, MAXDWORD, &ov);
        CloseHandle(handle_);
#else
        // Closing the descriptor drops the fcntl lock
        ::close(fd_);
#endif
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

  private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
#else
    int fd_ = -1;
#endif
};

/// fcntl locks are owned by the process, so threads are serialized here
/// before they take the file lock
std::mutex& process_mutex()
{
    static std::mutex m;
    return m;
}

std::filesystem::path sidecar(const std::filesystem::path& file, const char* suffix)
{
    return std::filesystem::path(file.string() + suffix);
}
} // namespace

void to_json(Json& j, const RegistryEntry& e)
{
    j = Json{{"server_name", e.server_name}, {"pid", e.pid},
             {"start_time", e.start_time},   {"process_token", e.process_token},
             {"config_hash", e.config_hash}, {"log_dir", e.log_dir},
             {"stdout_log", e.stdout_log},   {"stderr_log", e.stderr_log}};
}

void from_json(const Json& j, RegistryEntry& e)
{
    e.server_name = j.value("server_name", std::string());
    e.pid = j.value("pid", 0);
    e.start_time = j.value("start_time", std::string());
    e.process_token = j.value("process_token", std::string());
    e.config_hash = j.value("config_hash", std::string());
    e.log_dir = j.value("log_dir", std::string());
    e.stdout_log = j.value("stdout_log", std::string());
    e.stderr_log = j.value("stderr_log", std::string());
}

Registry::Registry(std::filesystem::path file) : file_(std::move(file)) {}

std::map<std::string, RegistryEntry> Registry::load_unlocked() const
{
    std::map<std::string, RegistryEntry> out;
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec))
        return out;

    std::ifstream in(file_);
    if (!in)
    {
        log::logger()->error("Cannot read server registry {}", file_.string());
        return out;
    }

    Json j;
    try
    {
        in >> j;
        if (!j.is_object())
            throw ConfigError("registry root is not an object");
        for (auto& [name, value] : j.items())
        {
            auto entry = value.get<RegistryEntry>();
            if (entry.server_name.empty())
                entry.server_name = name;
            out[name] = entry;
        }
    }
    catch (const std::exception& e)
    {
        // Left in place so it can be inspected; the next write replaces it
        log::logger()->error("Server registry {} is corrupt, ignoring it: {}", file_.string(),
                             e.what());
        out.clear();
    }
    return out;
}

void Registry::save_unlocked(const std::map<std::string, RegistryEntry>& entries) const
{
    Json j = Json::object();
    for (const auto& [name, entry] : entries)
        j[name] = entry;

    auto tmp = sidecar(file_, ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out)
            throw Error("cannot write server registry " + tmp.string());
        out << j.dump(2);
        out.flush();
        if (!out)
            throw Error("cannot write server registry " + tmp.string());
    }

    std::error_code ec;
    std::filesystem::rename(tmp, file_, ec);
    if (ec)
        throw Error("cannot replace server registry " + file_.string() + ": " + ec.message());
}

std::map<std::string, RegistryEntry> Registry::load() const
{
    std::lock_guard<std::mutex> lock(process_mutex());
    return load_unlocked();
}

void Registry::save(const std::map<std::string, RegistryEntry>& entries) const
{
    std::lock_guard<std::mutex> lock(process_mutex());
    std::filesystem::create_directories(file_.parent_path());
    FileLock file_lock(sidecar(file_, ".lock"));
    save_unlocked(entries);
}

void Registry::put(const RegistryEntry& entry)
{
    std::lock_guard<std::mutex> lock(process_mutex());
    std::filesystem::create_directories(file_.parent_path());
    FileLock file_lock(sidecar(file_, ".lock"));
    auto entries = load_unlocked();
    entries[entry.server_name] = entry;
    save_unlocked(entries);
    log::logger()->debug("Registered {} (pid {}) in {}", entry.server_name, entry.pid,
                         file_.string());
}

void Registry::remove(const std::string& name)
{
    std::lock_guard<std::mutex> lock(process_mutex());
    if (!std::filesystem::exists(file_))
        return;
    FileLock file_lock(sidecar(file_, ".lock"));
    auto entries = load_unlocked();
    if (entries.erase(name) == 0)
        return;
    save_unlocked(entries);
    log::logger()->debug("Removed {} from server registry", name);
}

std::optional<RegistryEntry> Registry::get(const std::string& name) const
{
    auto entries = load();
    auto it = entries.find(name);
    if (it == entries.end())
        return std::nullopt;
    return it->second;
}

std::optional<int> Registry::probe(const std::string& name)
{
    auto entry = get(name);
    if (!entry)
        return std::nullopt;
    if (is_alive(*entry))
        return entry->pid;

    log::logger()->info("Server {} (pid {}) is no longer running, dropping registry entry",
                        name, entry->pid);
    remove(name);
    return std::nullopt;
}

bool Registry::is_alive(const RegistryEntry& entry)
{
    if (entry.pid <= 0 || !process::pid_alive(entry.pid))
        return false;
    if (entry.process_token.empty())
        return true;
    auto current = process::start_token(entry.pid);
    if (current.empty() || current == entry.process_token)
        return true;
    log::logger()->info("Pid {} of server {} now belongs to another process", entry.pid,
                        entry.server_name);
    return false;
}

std::string fingerprint(const ServerConfig& config)
{
    // nlohmann::json objects are key-ordered, so dump() is canonical
    std::string canonical = config.raw.dump();

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx)
        throw Error("EVP_MD_CTX_new failed");
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, canonical.data(), canonical.size()) == 1 &&
              EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok)
        throw Error("SHA-256 digest failed");

    std::ostringstream out;
    for (unsigned int i = 0; i < hash_len; ++i)
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return out.str();
}

} // namespace multimcp
