#pragma once

#include <string>

namespace courier {

/**
 * Fully-qualified resource names of the form
 *   projects/{project}/topics/{topic}
 *   projects/{project}/subscriptions/{subscription}
 *
 * A short name is qualified with the given project; an already qualified name
 * is validated and returned as is. Malformed names raise
 * PubSubError(InvalidArgument).
 */
std::string qualify_topic(const std::string& project, const std::string& topic);

std::string qualify_subscription(const std::string& project, const std::string& subscription);

// Returns the last path segment of a qualified name.
std::string short_name(const std::string& qualified);

// Returns "projects/{project}" out of a qualified name.
std::string project_of(const std::string& qualified);

bool is_valid_resource_id(const std::string& id);

} // namespace courier
