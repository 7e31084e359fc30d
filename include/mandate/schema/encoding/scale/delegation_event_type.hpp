#pragma once

#include <mandate/schema/delegation_event_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    mandate::schema,
    delegation_event_type_t,
    mandate::schema::delegation_event_type_t::created,
    mandate::schema::delegation_event_type_t::revoked,
    mandate::schema::delegation_event_type_t::expired)
