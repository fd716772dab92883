#pragma once

#include <strongroom/schema/vote.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(strongroom::schema,
                             vote_t,
                             strongroom::schema::vote_t::approve,
                             strongroom::schema::vote_t::disapprove)
