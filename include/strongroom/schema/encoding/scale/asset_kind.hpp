#pragma once

#include <strongroom/schema/asset_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(strongroom::schema,
                             asset_kind_t,
                             strongroom::schema::asset_kind_t::native,
                             strongroom::schema::asset_kind_t::token)
