#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace sr {

// Canonical form used for partition matching. Paths that carry a URI scheme
// ("hdfs://...", "file:/...") are returned unchanged; local paths are made
// absolute and lexically normalized (symlinks are not resolved).
std::string qualify_path(std::string_view path);

// Plain string-prefix test, so "/t/p=1" also matches "/t/p=10/x".
bool path_in_partition(std::string_view qualified_path, std::string_view partition_prefix) noexcept;

// Strip "file://" or "file:" from a URL, leaving a local path.
std::string local_path_from_url(std::string_view url);

// True for "scheme://..." and "file:...".
bool has_uri_scheme(std::string_view path) noexcept;

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Slug generation for report directories: "hashprefix", "basename", or "keypath".
// At most `len` characters; len < 1 counts as 1.
std::string make_slug(std::string_view key, std::string_view mode, int len);

// Hash helper (stable within a build) used by slug.
std::string hex_hash_prefix(std::string_view data, int len);

}
