#pragma once

namespace JP {

// How two containers (arrays, objects, binary) are ordered against each other.
enum class ContainerOrdering {
    Footprint = 0,    // size of the in-memory container representation
    SerializedLength, // length of the compact serialized text
};

struct CompareOptions {
    ContainerOrdering containers = ContainerOrdering::Footprint;
};

} // namespace JP
