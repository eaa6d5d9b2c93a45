#include "model/note.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <json/json.h>

#include <memory>
#include <string>
#include <utility>

namespace notes {

std::string generate_note_id() {
    // random_generator is not thread-safe; one per thread.
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string write_compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"]    = true;
    return Json::writeString(builder, value);
}

std::string encode_payload(const CreateNoteRequest& request) {
    Json::Value root(Json::objectValue);
    root["title"]   = request.title;
    root["content"] = request.content;
    return write_compact(root);
}

std::variant<CreateNoteRequest, MalformedPayload>
decode_payload(std::string_view json) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs)) {
        return MalformedPayload{"invalid JSON: " + errs};
    }
    if (!root.isObject()) {
        return MalformedPayload{"expected a JSON object"};
    }

    const Json::Value& title   = root["title"];
    const Json::Value& content = root["content"];
    if (!title.isString()) {
        return MalformedPayload{"field 'title' must be a string"};
    }
    if (!content.isString()) {
        return MalformedPayload{"field 'content' must be a string"};
    }
    return CreateNoteRequest{title.asString(), content.asString()};
}

Note make_note(std::string id, CreateNoteRequest request) {
    return Note{std::move(id), std::move(request.title), std::move(request.content)};
}

Json::Value note_to_json(const Note& note) {
    Json::Value root(Json::objectValue);
    root["id"]      = note.id;
    root["title"]   = note.title;
    root["content"] = note.content;
    return root;
}

std::string encode_note(const Note& note) {
    return write_compact(note_to_json(note));
}

} // namespace notes
