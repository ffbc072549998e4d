#pragma once

#include <semnote/result.hpp>
#include <semnote/types.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace semnote {

namespace fs = std::filesystem;

/**
 * NoteSource - the note-management layer as seen by the indexer.
 *
 * Enumerates notes, validates note files and maps note ids to paths.
 */
class NoteSource {
public:
    virtual ~NoteSource() = default;

    virtual Result<std::vector<NoteId>> list_notes() const = 0;
    virtual bool is_note(const fs::path& path) const = 0;
    virtual Result<NoteId> id_for_path(const fs::path& path) const = 0;
    virtual Result<fs::path> path_for_id(const NoteId& note_id) const = 0;

    /**
     * Read a note's current content. The default reads path_for_id().
     */
    virtual Result<std::string> read_note(const NoteId& note_id) const;
};

/**
 * DirectoryNoteSource - notes are files under a root directory.
 *
 * A file is a note when it is a regular file below the root with one of the
 * accepted extensions and no hidden path component. Its id is the
 * root-relative path with '/' separators, e.g. "journal/2024-01-15.md" for
 * <root>/journal/2024-01-15.md, so every note file has exactly one id.
 */
class DirectoryNoteSource : public NoteSource {
public:
    explicit DirectoryNoteSource(fs::path root,
                                 std::vector<std::string> extensions = {".md", ".txt"});

    Result<std::vector<NoteId>> list_notes() const override;
    bool is_note(const fs::path& path) const override;
    Result<NoteId> id_for_path(const fs::path& path) const override;
    Result<fs::path> path_for_id(const NoteId& note_id) const override;

    const fs::path& root() const { return root_; }
    const std::vector<std::string>& extensions() const { return extensions_; }

private:
    bool has_note_extension(const fs::path& path) const;
    fs::path relative_to_root(const fs::path& path) const;

    fs::path root_;
    std::vector<std::string> extensions_;
};

/**
 * Read an entire file.
 */
Result<std::string> read_file(const fs::path& path);

}  // namespace semnote
