#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "error.h"
#include "geometry.h"

namespace tekanim::core {

namespace fs = std::filesystem;

// Ordered vector primitives of one external drawing plus their bounds.
struct VectorSource {
    Strokes strokes;
    Bounds bounds;

    static VectorSource from_strokes(Strokes strokes);
    VectorSource transformed(const Affine& transform) const;
};

bool load_vector_source(const fs::path& path, VectorSource& out, Error& error);

// Immutable once loaded; shared read-only by all frame workers.
class SourceLibrary {
public:
    bool load(const std::vector<std::string>& paths, Error& error);
    void add(const std::string& path, VectorSource source);
    const VectorSource* find(const std::string& path) const;
    size_t size() const { return sources_.size(); }

private:
    std::map<std::string, VectorSource> sources_;
};

} // namespace tekanim::core
