#include <semnote/notes.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace semnote {

Result<std::string> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Error(ErrorCode::IO_ERROR, "Failed to read " + path.string());
    }
    return ss.str();
}

Result<std::string> NoteSource::read_note(const NoteId& note_id) const {
    auto path = path_for_id(note_id);
    if (!path.ok()) {
        return path.error();
    }
    return read_file(path.value());
}

// ============================================================================
// DirectoryNoteSource
// ============================================================================

DirectoryNoteSource::DirectoryNoteSource(fs::path root, std::vector<std::string> extensions)
    : root_(std::move(root))
    , extensions_(std::move(extensions)) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(root_, ec);
    if (!ec) {
        root_ = canonical;
    }
}

bool DirectoryNoteSource::has_note_extension(const fs::path& path) const {
    std::string ext = path.extension().string();
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

fs::path DirectoryNoteSource::relative_to_root(const fs::path& path) const {
    std::error_code ec;
    fs::path absolute = fs::weakly_canonical(path.is_absolute() ? path : root_ / path, ec);
    if (ec) {
        return {};
    }
    fs::path rel = absolute.lexically_relative(root_);
    if (rel.empty() || *rel.begin() == "..") {
        return {};
    }
    return rel;
}

bool DirectoryNoteSource::is_note(const fs::path& path) const {
    fs::path rel = relative_to_root(path);
    if (rel.empty() || !has_note_extension(rel)) {
        return false;
    }

    for (const auto& part : rel) {
        std::string name = part.string();
        if (!name.empty() && name[0] == '.') {
            return false;
        }
    }

    std::error_code ec;
    return fs::is_regular_file(root_ / rel, ec);
}

Result<NoteId> DirectoryNoteSource::id_for_path(const fs::path& path) const {
    if (!is_note(path)) {
        return Error(ErrorCode::NOT_A_NOTE, path.string() + " is not a note");
    }

    return relative_to_root(path).generic_string();
}

Result<fs::path> DirectoryNoteSource::path_for_id(const NoteId& note_id) const {
    if (note_id.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Empty note id");
    }

    fs::path candidate = root_ / fs::path(note_id);
    if (is_note(candidate) && relative_to_root(candidate).generic_string() == note_id) {
        return candidate;
    }

    return Error(ErrorCode::NOT_FOUND, "No note file for id '" + note_id + "'");
}

Result<std::vector<NoteId>> DirectoryNoteSource::list_notes() const {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return Error(ErrorCode::NOT_FOUND, "Notes directory not found: " + root_.string());
    }

    std::vector<NoteId> ids;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
            "Cannot list " + root_.string() + ": " + ec.message());
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                "Cannot list " + root_.string() + ": " + ec.message());
        }

        std::string name = it->path().filename().string();
        if (!name.empty() && name[0] == '.') {
            if (it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (!it->is_regular_file(ec) || !has_note_extension(it->path())) {
            continue;
        }

        ids.push_back(it->path().lexically_relative(root_).generic_string());
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace semnote
