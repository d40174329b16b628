#include "resource_names.hpp"
#include "errors.hpp"

#include <cctype>
#include <vector>

namespace courier {

namespace {

const std::string kProjectsPrefix = "projects/";

std::vector<std::string> split_path(const std::string& name) {
    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (true) {
        auto next = name.find('/', pos);
        if (next == std::string::npos) {
            parts.push_back(name.substr(pos));
            break;
        }
        parts.push_back(name.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

std::string qualify(const std::string& project, const std::string& name, const std::string& collection) {
    if (name.compare(0, kProjectsPrefix.size(), kProjectsPrefix) == 0) {
        auto parts = split_path(name);
        if (parts.size() != 4 || parts[2] != collection || parts[1].empty() || !is_valid_resource_id(parts[3])) {
            throw PubSubError(StatusCode::InvalidArgument, "malformed " + collection + " name '" + name + "'");
        }
        return name;
    }

    if (!is_valid_resource_id(name)) {
        throw PubSubError(StatusCode::InvalidArgument, "malformed " + collection + " name '" + name + "'");
    }
    if (project.empty()) {
        throw PubSubError(StatusCode::InvalidArgument, "no project to qualify '" + name + "'");
    }
    return kProjectsPrefix + project + "/" + collection + "/" + name;
}

} // namespace

std::string qualify_topic(const std::string& project, const std::string& topic) {
    return qualify(project, topic, "topics");
}

std::string qualify_subscription(const std::string& project, const std::string& subscription) {
    return qualify(project, subscription, "subscriptions");
}

std::string short_name(const std::string& qualified) {
    auto pos = qualified.rfind('/');
    return pos == std::string::npos ? qualified : qualified.substr(pos + 1);
}

std::string project_of(const std::string& qualified) {
    auto parts = split_path(qualified);
    if (parts.size() < 2 || parts[0] != "projects") {
        throw PubSubError(StatusCode::InvalidArgument, "not a qualified name '" + qualified + "'");
    }
    return kProjectsPrefix + parts[1];
}

// 3 to 255 characters, starting with a letter, no "goog" prefix.
bool is_valid_resource_id(const std::string& id) {
    if (id.size() < 3 || id.size() > 255) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(id[0]))) {
        return false;
    }
    if (id.compare(0, 4, "goog") == 0) {
        return false;
    }
    for (char c : id) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_' && c != '.' && c != '~' && c != '+' && c != '%') {
            return false;
        }
    }
    return true;
}

} // namespace courier
