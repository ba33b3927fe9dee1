#pragma once

#include "fs/model/File.hpp"

#include <string>

namespace ds::preview {

// The external conversion backend. May be slow; throws on any failure.
class Converter {
public:
    virtual ~Converter() = default;

    // Returns the location of the rendered artifact.
    virtual std::string convert(const fs::model::File& file) = 0;
};

}
