#pragma once

#include <mandate/schema/end_reason.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(mandate::schema,
                             end_reason_t,
                             mandate::schema::end_reason_t::revoked,
                             mandate::schema::end_reason_t::expired)
