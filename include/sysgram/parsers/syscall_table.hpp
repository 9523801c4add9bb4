/**
 * @file syscall_table.hpp
 * @brief Syscall name / identifier mapping
 *
 * Capture sources see syscalls either by name (strace) or by raw kernel
 * number (recorded id traces). The table resolves names to raw numbers and
 * optionally remaps raw numbers to the canonical identifiers a model was
 * trained with.
 *
 * **Mapping file**:
 * ```json
 * {
 *   "names":  { "openat": 257, "my_custom_call": 548 },
 *   "id_map": { "0": 0, "1": 1, "257": 2 }
 * }
 * ```
 * `syscall_seq` is accepted as an alias of `id_map`. When an id map is
 * present, raw ids missing from it are dropped.
 *
 * @date 2025
 */

#pragma once

#include "sysgram/core/types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace sysgram {
namespace parsers {

/**
 * @class SyscallTable
 * @brief Name → raw id → canonical id resolution
 */
class SyscallTable {
public:
    SyscallTable() = default;

    /**
     * @brief Table of common x86_64 Linux syscalls, without id map
     */
    static SyscallTable BuiltIn();

    /**
     * @brief Built-in table extended by a mapping file
     * @param path JSON mapping file
     * @throws core::ConfigurationError if the file is unreadable or malformed
     */
    static SyscallTable LoadFromFile(const std::filesystem::path& path);

    /// Register (or rename) a syscall
    void Add(const std::string& name, core::SyscallId raw_id);

    /// Map a raw id to a canonical id; enables id mapping
    void MapId(core::SyscallId raw_id, core::SyscallId canonical_id);

    /**
     * @brief Canonical id of a syscall name
     * @return Id, or nullopt for unknown or unmapped names
     */
    std::optional<core::SyscallId> Resolve(const std::string& name) const;

    /**
     * @brief Canonical id of a raw id
     * @return Raw id itself without id map, mapped id, or nullopt if unmapped
     */
    std::optional<core::SyscallId> Canonicalize(core::SyscallId raw_id) const;

    /// Name of a raw id, if known
    std::optional<std::string> NameOf(core::SyscallId raw_id) const;

    std::size_t Size() const { return ids_.size(); }
    bool HasIdMap() const { return !id_map_.empty(); }

private:
    std::unordered_map<std::string, core::SyscallId> ids_;
    std::unordered_map<core::SyscallId, std::string> names_;
    std::unordered_map<core::SyscallId, core::SyscallId> id_map_;
};

} // namespace parsers
} // namespace sysgram
