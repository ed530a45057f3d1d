#ifndef SHEAR_DEPENDENCY_HPP
#define SHEAR_DEPENDENCY_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/extract.hpp"

namespace Shear::Dependency {
    using DepthwisePolicy = Details::DepthwisePolicy;
    using ExtractOptions = Details::ExtractOptions;
    using DependencyEdge = Details::DependencyEdge;
    using ExtractionResult = Details::ExtractionResult;

    using Details::extract_all;
    using Details::extract_dependencies;
}

#endif //SHEAR_DEPENDENCY_HPP
