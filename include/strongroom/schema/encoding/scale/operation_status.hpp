#pragma once

#include <strongroom/schema/operation_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(strongroom::schema,
                             operation_status_t,
                             strongroom::schema::operation_status_t::pending,
                             strongroom::schema::operation_status_t::approved,
                             strongroom::schema::operation_status_t::rejected,
                             strongroom::schema::operation_status_t::expired)
