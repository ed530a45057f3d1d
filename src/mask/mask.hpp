#ifndef SHEAR_MASK_HPP
#define SHEAR_MASK_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/channel_mask.hpp"
#include "details/compute.hpp"
#include "details/importance.hpp"

namespace Shear::Mask {
    using ChannelMask = Details::ChannelMask;
    using MaskSet = Details::MaskSet;
    using Importance = Details::Importance;
    using DegeneratePolicy = Details::DegeneratePolicy;
    using MaskOptions = Details::MaskOptions;

    using Details::channel_importance;
    using Details::compute_mask;
    using Details::mask_from_scores;
}

#endif //SHEAR_MASK_HPP
