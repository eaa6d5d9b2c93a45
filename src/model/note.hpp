#pragma once

#include <string>
#include <string_view>
#include <variant>

#include <json/json.h>

namespace notes {

// ── Note model ────────────────────────────────────────────────────────────────

// Body of POST /notes and PUT /notes/{id}.  Carries no identifier: the id is
// generated (create) or taken from the path (update).
struct CreateNoteRequest {
    std::string title;
    std::string content;
};

// A stored note.  The identifier is the storage key; it is never part of the
// stored payload.
struct Note {
    std::string id;
    std::string title;
    std::string content;
};

// Decoding failure for a payload or request body.
struct MalformedPayload {
    std::string reason;
};

// ── Identifiers ───────────────────────────────────────────────────────────────

// Returns a fresh random UUID v4 in canonical lowercase hyphenated form.
// Thread-safe.
[[nodiscard]] std::string generate_note_id();

// ── JSON codec (jsoncpp) ──────────────────────────────────────────────────────
//
// Stored payload: {"title": "...", "content": "..."}
// HTTP note:      {"id": "...", "title": "...", "content": "..."}
//
// All functions are pure and thread-safe.

// Serialize the stored payload for `request` (compact, no trailing newline).
[[nodiscard]] std::string encode_payload(const CreateNoteRequest& request);

// Parse a stored payload or request body.  Requires a JSON object with string
// members "title" and "content"; other members are ignored.
[[nodiscard]] std::variant<CreateNoteRequest, MalformedPayload>
decode_payload(std::string_view json);

// Build a Note from its storage key and stored payload.
[[nodiscard]] Note make_note(std::string id, CreateNoteRequest request);

// JSON object for a Note, identifier included (HTTP responses).
[[nodiscard]] Json::Value note_to_json(const Note& note);

// Serialize a Note with its identifier for HTTP responses.
[[nodiscard]] std::string encode_note(const Note& note);

// Compact single-line serialization shared by the encoders above.
[[nodiscard]] std::string write_compact(const Json::Value& value);

} // namespace notes
