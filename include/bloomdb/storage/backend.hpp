#pragma once

/** \file backend.hpp
 *  \brief Byte storage addressed by location strings, selected by scheme.
 *
 * A location is "scheme://path" or a bare path. Bare paths and "file://" map to
 * the local filesystem; other schemes resolve through the backend registry so an
 * object-store client can be plugged in without touching IndexStore.
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "bloomdb/error.hpp"

namespace bloomdb::storage {

class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /** \brief Whole object; not_found when absent, io_failed otherwise. */
    virtual auto get(const std::string& location) -> std::expected<std::vector<std::uint8_t>, core::error> = 0;

    /** \brief Create or replace the object at location. */
    virtual auto put(const std::string& location, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error> = 0;

    /** \brief Locations directly under prefix whose name matches the shell glob,
     *         in lexicographic order. not_found when prefix does not exist. */
    virtual auto list(const std::string& prefix, const std::string& pattern)
        -> std::expected<std::vector<std::string>, core::error> = 0;
};

/** \brief Local filesystem; put() writes a temporary sibling and renames it into place. */
class LocalBackend final : public StorageBackend {
public:
    auto get(const std::string& location) -> std::expected<std::vector<std::uint8_t>, core::error> override;
    auto put(const std::string& location, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error> override;
    auto list(const std::string& prefix, const std::string& pattern)
        -> std::expected<std::vector<std::string>, core::error> override;
};

struct SplitLocation {
    std::string_view scheme; /**< empty for bare paths */
    std::string_view path;
};

/** \brief Split "scheme://path"; a bare path yields an empty scheme. */
auto split_location(std::string_view location) noexcept -> SplitLocation;

/** \brief Join a location and a child name with exactly one '/'. */
auto join_location(std::string_view base, std::string_view child) -> std::string;

/** \brief Shell-glob match of a single name (no path separators crossed). */
auto glob_match(const std::string& pattern, const std::string& name) noexcept -> bool;

using BackendFactory = std::function<std::shared_ptr<StorageBackend>()>;

/** \brief Register or replace the factory serving a scheme. Thread-safe. */
auto register_backend(std::string scheme, BackendFactory factory) -> void;

/** \brief Backend for a location's scheme; unsupported when none is registered. */
auto open_backend(std::string_view location) -> std::expected<std::shared_ptr<StorageBackend>, core::error>;

} // namespace bloomdb::storage
