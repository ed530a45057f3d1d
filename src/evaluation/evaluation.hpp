#ifndef SHEAR_EVALUATION_HPP
#define SHEAR_EVALUATION_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/equivalence.hpp"

namespace Shear::Evaluation {
    using EquivalenceOptions = Details::EquivalenceOptions;
    using EquivalenceReport = Details::EquivalenceReport;
    using OutputComparison = Details::OutputComparison;

    using Details::validate_equivalence;
}

#endif //SHEAR_EVALUATION_HPP
