#include "vector_source.h"

#include <fstream>
#include <utility>

#include "cli_parse.h"
#include "hpgl.h"

namespace tekanim::core {

VectorSource VectorSource::from_strokes(Strokes strokes) {
    VectorSource source;
    source.bounds = stroke_bounds(strokes);
    source.strokes = std::move(strokes);
    return source;
}

VectorSource VectorSource::transformed(const Affine& transform) const {
    return from_strokes(transform_strokes(strokes, transform));
}

bool load_vector_source(const fs::path& path, VectorSource& out, Error& error) {
    std::ifstream in(path);
    if (!in) {
        return fail(error, ErrorKind::Collaborator, "failed to open vector source " + to_quoted(path.string()));
    }
    VectorSource source = VectorSource::from_strokes(parse_hpgl(in));
    if (in.bad()) {
        return fail(error, ErrorKind::Collaborator, "failed to read vector source " + to_quoted(path.string()));
    }
    out = std::move(source);
    return true;
}

bool SourceLibrary::load(const std::vector<std::string>& paths, Error& error) {
    for (const auto& path : paths) {
        if (sources_.contains(path)) {
            continue;
        }
        VectorSource source;
        if (!load_vector_source(path, source, error)) {
            return false;
        }
        sources_.emplace(path, std::move(source));
    }
    return true;
}

void SourceLibrary::add(const std::string& path, VectorSource source) {
    sources_.insert_or_assign(path, std::move(source));
}

const VectorSource* SourceLibrary::find(const std::string& path) const {
    auto it = sources_.find(path);
    if (it == sources_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace tekanim::core
