// ==============================================================================
// source.cpp - Источники файлов (локальное дерево / объектное хранилище)
// ==============================================================================

#include "turbosort/source.hpp"

#include "turbosort/platform.hpp"
#include "turbosort/s3.hpp"

#include <algorithm>
#include <deque>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace turbosort::source {

namespace fs = std::filesystem;

namespace {

void sort_by_name(std::vector<SourceItem>& items) {
    std::sort(items.begin(), items.end(),
              [](const SourceItem& a, const SourceItem& b) { return a.name < b.name; });
}

}  // namespace

std::string parent_prefix(const std::string& key) {
    size_t slash = key.rfind('/');
    if (slash == std::string::npos) {
        return std::string();
    }
    return key.substr(0, slash + 1);
}

// ============================================================================
// LocalSource
// ============================================================================

LocalSource::LocalSource(const fs::path& root, std::string marker_name)
    : marker_name_(std::move(marker_name)) {
    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    root_ = (ec ? root : abs).lexically_normal();
    // Без завершающего разделителя: "/data/src/" -> "/data/src"
    if (!root_.has_filename() && root_.has_parent_path() && root_ != root_.root_path()) {
        root_ = root_.parent_path();
    }
}

std::string LocalSource::describe() const {
    return platform::path_to_utf8(root_);
}

std::string LocalSource::dir_key(const fs::path& dir) {
    return platform::path_to_utf8(dir);
}

MarkerDirs LocalSource::list_marker_dirs() {
    MarkerDirs result;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        result.error = "source directory " + platform::path_to_utf8(root_) + " is not accessible" +
                       (ec ? ": " + ec.message() : std::string());
        return result;
    }

    // Обход очередью вместо рекурсии
    std::deque<fs::path> pending;
    pending.push_back(root_);

    while (!pending.empty()) {
        fs::path dir = std::move(pending.front());
        pending.pop_front();

        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            result.warnings.push_back("cannot read directory " + platform::path_to_utf8(dir) +
                                      ": " + ec.message());
            ec.clear();
            continue;
        }

        bool has_marker = false;
        std::vector<fs::path> subdirs;
        for (const fs::directory_entry& entry : it) {
            std::error_code entry_ec;
            // Символические ссылки на директории не обходятся
            if (entry.is_directory(entry_ec) && !entry.is_symlink(entry_ec)) {
                subdirs.push_back(entry.path());
            } else if (entry.path().filename() == marker_name_ &&
                       entry.is_regular_file(entry_ec)) {
                has_marker = true;
            }
        }

        if (has_marker) {
            result.dirs.push_back(dir_key(dir));
        }

        std::sort(subdirs.begin(), subdirs.end());
        for (auto& sub : subdirs) {
            pending.push_back(std::move(sub));
        }
    }

    result.ok = true;
    return result;
}

MarkerRead LocalSource::read_marker(const std::string& dir) {
    MarkerRead result;
    fs::path marker = platform::path_from_utf8(dir) / marker_name_;

    std::error_code ec;
    if (!fs::is_regular_file(marker, ec)) {
        result.status = MarkerStatus::Absent;
        return result;
    }

    std::ifstream in(marker, std::ios::binary);
    if (!in.is_open()) {
        result.status = MarkerStatus::Unreadable;
        result.error = "cannot open " + platform::path_to_utf8(marker);
        return result;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        result.status = MarkerStatus::Unreadable;
        result.error = "read error on " + platform::path_to_utf8(marker);
        return result;
    }

    result.status = MarkerStatus::Ok;
    result.content = buffer.str();
    return result;
}

Children LocalSource::enumerate_children(const std::string& dir) {
    Children result;
    fs::path base = platform::path_from_utf8(dir);

    std::error_code ec;
    fs::directory_iterator it(base, ec);
    if (ec) {
        result.error = "cannot read directory " + dir + ": " + ec.message();
        return result;
    }

    for (const fs::directory_entry& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        std::string name = platform::path_to_utf8(entry.path().filename());
        if (name == marker_name_) {
            continue;
        }
        SourceItem item;
        item.key = platform::path_to_utf8(entry.path());
        item.name = std::move(name);
        result.items.push_back(std::move(item));
    }

    sort_by_name(result.items);
    result.ok = true;
    return result;
}

StatResult LocalSource::stat_identity(const SourceItem& item) {
    StatResult result;
    auto state = identity::stat_local(platform::path_from_utf8(item.key));
    if (!state) {
        result.status = StatStatus::Vanished;
        return result;
    }
    result.status = StatStatus::Ok;
    result.state = std::move(*state);
    return result;
}

FetchResult LocalSource::fetch(const SourceItem& item, const fs::path& dst) {
    FetchResult result;
    if (!platform::copy_file_preserving(platform::path_from_utf8(item.key), dst, result.error)) {
        return result;
    }

    std::error_code ec;
    result.size = fs::file_size(dst, ec);
    if (ec) {
        result.size = 0;
    }
    result.ok = true;
    return result;
}

Presence LocalSource::exists(const std::string& key, std::string& error) {
    std::error_code ec;
    bool present = fs::exists(platform::path_from_utf8(key), ec);
    if (ec) {
        error = ec.message();
        return Presence::Unknown;
    }
    return present ? Presence::Present : Presence::Missing;
}

// ============================================================================
// RemoteSource
// ============================================================================

RemoteSource::RemoteSource(s3::ObjectStore& store, std::string prefix, std::string marker_name)
    : store_(store), prefix_(std::move(prefix)), marker_name_(std::move(marker_name)) {
    if (!prefix_.empty() && prefix_.back() != '/') {
        prefix_ += '/';
    }
}

std::string RemoteSource::describe() const {
    return store_.describe();
}

MarkerDirs RemoteSource::list_marker_dirs() {
    MarkerDirs result;

    s3::ListResult listing = store_.list(prefix_);
    if (!listing.ok) {
        result.error = listing.error.message;
        return result;
    }

    std::set<std::string> dirs;
    for (const auto& obj : listing.objects) {
        std::string parent = parent_prefix(obj.key);
        if (obj.key.size() - parent.size() == marker_name_.size() &&
            obj.key.compare(parent.size(), std::string::npos, marker_name_) == 0) {
            dirs.insert(std::move(parent));
        }
    }

    result.dirs.assign(dirs.begin(), dirs.end());
    result.ok = true;
    return result;
}

MarkerRead RemoteSource::read_marker(const std::string& dir) {
    MarkerRead result;
    const std::string key = dir + marker_name_;

    fs::path tmp;
    try {
        tmp = platform::make_temp_file_near(fs::temp_directory_path() / "turbosort-marker");
    } catch (const std::exception& e) {
        result.status = MarkerStatus::Unreadable;
        result.error = e.what();
        return result;
    }

    s3::GetResult got = store_.get(key, tmp);
    if (!got.ok) {
        std::error_code ec;
        fs::remove(tmp, ec);
        if (got.error.http_status == 404) {
            result.status = MarkerStatus::Absent;
        } else {
            result.status = MarkerStatus::Unreadable;
            result.error = got.error.message;
        }
        return result;
    }

    std::ifstream in(tmp, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    const bool read_ok = in.is_open() && !in.bad();
    in.close();

    std::error_code ec;
    fs::remove(tmp, ec);

    if (!read_ok) {
        result.status = MarkerStatus::Unreadable;
        result.error = "cannot read downloaded marker " + key;
        return result;
    }

    result.status = MarkerStatus::Ok;
    result.content = buffer.str();
    return result;
}

Children RemoteSource::enumerate_children(const std::string& dir) {
    Children result;

    s3::ListResult listing = store_.list(dir);
    if (!listing.ok) {
        result.error = listing.error.message;
        return result;
    }

    for (const auto& obj : listing.objects) {
        if (obj.key.size() <= dir.size() || obj.key.compare(0, dir.size(), dir) != 0) {
            continue;
        }
        std::string name = obj.key.substr(dir.size());
        // Вложенные "директории" и объекты-заглушки директорий
        if (name.find('/') != std::string::npos || name == marker_name_) {
            continue;
        }
        SourceItem item;
        item.key = obj.key;
        item.name = std::move(name);
        result.items.push_back(std::move(item));
    }

    sort_by_name(result.items);
    result.ok = true;
    return result;
}

StatResult RemoteSource::stat_identity(const SourceItem& item) {
    StatResult result;

    s3::HeadResult head = store_.head(item.key);
    if (!head.ok) {
        result.status = StatStatus::Failed;
        result.error = head.error.message;
        return result;
    }
    if (!head.found) {
        result.status = StatStatus::Vanished;
        return result;
    }

    result.status = StatStatus::Ok;
    result.state.size = head.info.size;
    result.state.identity = identity::remote_identity(item.key, head.info.etag);
    return result;
}

FetchResult RemoteSource::fetch(const SourceItem& item, const fs::path& dst) {
    FetchResult result;

    s3::GetResult got = store_.get(item.key, dst);
    if (!got.ok) {
        result.error = got.error.message;
        return result;
    }

    result.ok = true;
    result.size = got.info.size;
    result.warning = got.warning;
    // Объект мог измениться между head и get: записывается загруженная версия
    if (!got.info.etag.empty()) {
        identity::ItemState observed;
        observed.size = got.info.size;
        observed.identity = identity::remote_identity(item.key, got.info.etag);
        result.observed = std::move(observed);
    }
    return result;
}

Presence RemoteSource::exists(const std::string& key, std::string& error) {
    s3::HeadResult head = store_.head(key);
    if (!head.ok) {
        error = head.error.message;
        return Presence::Unknown;
    }
    return head.found ? Presence::Present : Presence::Missing;
}

}  // namespace turbosort::source
