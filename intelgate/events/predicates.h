#pragma once
#include <string>
#include <vector>
#include "subscription.h"

// Stock predicates for subscribe(). Each returns an event_predicate that
// reads the subscriber's auth_context at evaluation time.

// Same organization as the subscriber. SUPER_ADMIN sees every organization,
// or only `organization` when one is given.
event_predicate organization_filter(std::string organization = {});

// Events at or above `threshold`
event_predicate severity_filter(severity_level threshold);

// Events touching any of `assets` (the entity itself when it is an asset,
// or one of its affected assets). An empty list matches everything.
event_predicate asset_filter(std::vector<std::string> assets);

event_predicate actor_filter(std::string actor_id);

event_predicate change_kind_filter(std::vector<change_kind> kinds);

// Conjunction; null predicates are skipped
event_predicate all_of(std::vector<event_predicate> predicates);
