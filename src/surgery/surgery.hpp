#ifndef SHEAR_SURGERY_HPP
#define SHEAR_SURGERY_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/apply.hpp"
#include "details/report.hpp"

namespace Shear::Surgery {
    using LayerStatus = Details::LayerStatus;
    using LayerReport = Details::LayerReport;
    using SurgeryReport = Details::SurgeryReport;
    using SurgeryOptions = Details::SurgeryOptions;
    using SurgeryResult = Details::SurgeryResult;

    using Details::apply_surgery;
}

#endif //SHEAR_SURGERY_HPP
