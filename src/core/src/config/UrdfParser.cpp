/**
 * @file UrdfParser.cpp
 * @brief URDF parser implementation
 *
 * Uses simple regex-based XML extraction without external dependencies.
 */

#include "UrdfParser.hpp"
#include "../logging/Logger.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

namespace arm_teleop {
namespace config {

namespace {
    constexpr double PI = 3.14159265358979323846;

    std::string getAttributeValue(const std::string& element, const std::string& attr) {
        // Leading \b keeps "name" from matching inside "filename"
        std::regex pattern("\\b" + attr + "\\s*=\\s*\"([^\"]*)\"");
        std::smatch match;
        if (std::regex_search(element, match, pattern)) {
            return match[1].str();
        }
        return "";
    }

    // Lazy attribute scan so a self-closing element never swallows its
    // successor up to the next closing tag.
    std::string elementPattern(const std::string& tag) {
        return "<" + tag + "(?:\\s[^>]*?)?(?:/>|>[\\s\\S]*?<\\/" + tag + ">)";
    }

    std::vector<std::string> findElements(const std::string& xml, const std::string& tag) {
        std::vector<std::string> elements;
        std::regex pattern(elementPattern(tag));

        auto begin = std::sregex_iterator(xml.begin(), xml.end(), pattern);
        auto end = std::sregex_iterator();
        for (auto it = begin; it != end; ++it) {
            elements.push_back(it->str());
        }
        return elements;
    }

    std::string findChildElement(const std::string& parent, const std::string& tag) {
        std::smatch match;
        std::regex pattern(elementPattern(tag));
        if (std::regex_search(parent, match, pattern)) {
            return match[0].str();
        }
        return "";
    }

    std::string stripComments(const std::string& xml) {
        static const std::regex comment("<!--[\\s\\S]*?-->");
        return std::regex_replace(xml, comment, "");
    }

    std::vector<double> parseDoubleArray(const std::string& str) {
        std::vector<double> result;
        std::istringstream iss(str);
        double val;
        while (iss >> val) {
            result.push_back(val);
        }
        return result;
    }
}

// ============================================================================
// UrdfModel lookups
// ============================================================================

const UrdfJoint* UrdfModel::findJoint(const std::string& joint_name) const {
    for (const auto& j : joints) {
        if (j.name == joint_name) return &j;
    }
    return nullptr;
}

const UrdfJoint* UrdfModel::jointWithChild(const std::string& link_name) const {
    for (const auto& j : joints) {
        if (j.child_link == link_name) return &j;
    }
    return nullptr;
}

bool UrdfModel::hasLink(const std::string& link_name) const {
    for (const auto& l : links) {
        if (l.name == link_name) return true;
    }
    return false;
}

// ============================================================================
// Parsing
// ============================================================================

UrdfParseResult UrdfParser::parseFile(const std::filesystem::path& filepath) {
    UrdfParseResult result;

    if (!std::filesystem::exists(filepath)) {
        result.error = "File not found: " + filepath.string();
        LOG_ERROR("{}", result.error);
        return result;
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        result.error = "Cannot open file: " + filepath.string();
        LOG_ERROR("{}", result.error);
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    LOG_INFO("Parsing URDF file: {}", filepath.string());
    return parseString(buffer.str());
}

UrdfParseResult UrdfParser::parseString(const std::string& xml_content) {
    UrdfParseResult result;

    try {
        std::string xml = stripComments(xml_content);

        static const std::regex robot_head("<robot(?:\\s[^>]*)?>");
        std::smatch head_match;
        if (!std::regex_search(xml, head_match, robot_head)) {
            result.error = "No <robot> element";
            LOG_ERROR("URDF parse error: {}", result.error);
            return result;
        }
        result.model.name = getAttributeValue(head_match[0].str(), "name");
        const std::string robot = xml.substr(head_match.position(0));

        for (const auto& link_xml : findElements(robot, "link")) {
            UrdfLink link;
            link.name = getAttributeValue(link_xml.substr(0, link_xml.find('>')), "name");
            if (link.name.empty()) continue;
            result.model.links.push_back(link);
        }

        for (const auto& joint_xml : findElements(robot, "joint")) {
            std::string head = joint_xml.substr(0, joint_xml.find('>'));

            UrdfJoint joint;
            joint.name = getAttributeValue(head, "name");
            joint.type = getAttributeValue(head, "type");

            // <transmission> joint references carry no type
            if (joint.name.empty() || joint.type.empty()) continue;

            joint.parent_link = getAttributeValue(findChildElement(joint_xml, "parent"), "link");
            joint.child_link = getAttributeValue(findChildElement(joint_xml, "child"), "link");
            if (joint.parent_link.empty() || joint.child_link.empty()) {
                result.error = "Joint '" + joint.name + "' lacks parent or child link";
                LOG_ERROR("URDF parse error: {}", result.error);
                return result;
            }

            std::string origin = findChildElement(joint_xml, "origin");
            if (!origin.empty()) {
                parseTriple(getAttributeValue(origin, "xyz"), joint.origin_xyz);
                parseTriple(getAttributeValue(origin, "rpy"), joint.origin_rpy);
            }

            std::string axis = findChildElement(joint_xml, "axis");
            if (!axis.empty()) {
                parseTriple(getAttributeValue(axis, "xyz"), joint.axis);
            }
            double norm = std::sqrt(joint.axis[0] * joint.axis[0] +
                                    joint.axis[1] * joint.axis[1] +
                                    joint.axis[2] * joint.axis[2]);
            if (joint.isMovable() && norm < 1e-12) {
                result.error = "Joint '" + joint.name + "' has a zero axis";
                LOG_ERROR("URDF parse error: {}", result.error);
                return result;
            }
            if (norm > 1e-12) {
                for (auto& a : joint.axis) a /= norm;
            }

            std::string limit = findChildElement(joint_xml, "limit");
            if (!limit.empty()) {
                parseLimit(
                    getAttributeValue(limit, "lower"),
                    getAttributeValue(limit, "upper"),
                    getAttributeValue(limit, "velocity"),
                    getAttributeValue(limit, "effort"),
                    joint
                );
            }
            if (joint.type == "continuous") {
                joint.limit_lower = -std::numeric_limits<double>::infinity();
                joint.limit_upper = std::numeric_limits<double>::infinity();
            }

            result.model.joints.push_back(joint);
            LOG_DEBUG("Parsed joint: {} type: {} origin: [{}, {}, {}]",
                joint.name, joint.type,
                joint.origin_xyz[0], joint.origin_xyz[1], joint.origin_xyz[2]);
        }

        if (result.model.links.empty()) {
            result.error = "URDF contains no links";
            LOG_ERROR("URDF parse error: {}", result.error);
            return result;
        }

        for (const auto& joint : result.model.joints) {
            if (!result.model.hasLink(joint.parent_link) || !result.model.hasLink(joint.child_link)) {
                result.error = "Joint '" + joint.name + "' references an undefined link";
                LOG_ERROR("URDF parse error: {}", result.error);
                return result;
            }
        }

        result.model.base_link_name = findBaseLink(result.model);
        orderJoints(result.model);

        result.success = true;
        LOG_INFO("URDF parsing complete: {} links, {} joints ({} movable), base '{}'",
            result.model.links.size(), result.model.joints.size(),
            result.model.joint_order.size(), result.model.base_link_name);

    } catch (const std::exception& e) {
        result.error = std::string("Parse error: ") + e.what();
        LOG_ERROR("URDF parse error: {}", e.what());
    }

    return result;
}

void UrdfParser::parseTriple(const std::string& str, std::array<double, 3>& out) {
    if (str.empty()) return;

    auto vals = parseDoubleArray(str);
    if (vals.size() < 3) {
        throw std::runtime_error("Expected three values, got '" + str + "'");
    }
    out = {vals[0], vals[1], vals[2]};
}

void UrdfParser::parseLimit(const std::string& lower, const std::string& upper,
                             const std::string& velocity, const std::string& effort,
                             UrdfJoint& joint) {
    if (!lower.empty()) {
        joint.limit_lower = expandXacroExpression(lower);
    }
    if (!upper.empty()) {
        joint.limit_upper = expandXacroExpression(upper);
    }
    if (!velocity.empty()) {
        joint.limit_velocity = expandXacroExpression(velocity);
    }
    if (!effort.empty()) {
        joint.limit_effort = expandXacroExpression(effort);
    }
    if (joint.limit_lower > joint.limit_upper) {
        throw std::runtime_error("Joint '" + joint.name + "' has lower limit above upper limit");
    }
}

double UrdfParser::expandXacroExpression(const std::string& expr) {
    // Pattern: ${radians(X)}
    std::regex radians_pattern("\\$\\{radians\\(([-\\d.eE+]+)\\)\\}");
    std::smatch match;

    try {
        if (std::regex_search(expr, match, radians_pattern)) {
            double degrees = std::stod(match[1].str());
            return degrees * PI / 180.0;
        }
        return std::stod(expr);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Cannot evaluate expression '" + expr + "'");
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Expression out of range '" + expr + "'");
    }
}

std::string UrdfParser::findBaseLink(const UrdfModel& model) {
    std::set<std::string> child_links;
    for (const auto& joint : model.joints) {
        child_links.insert(joint.child_link);
    }

    std::string first_root;
    for (const auto& link : model.links) {
        if (child_links.find(link.name) == child_links.end()) {
            if (link.name.find("base") != std::string::npos) {
                return link.name;
            }
            if (first_root.empty()) {
                first_root = link.name;
            }
        }
    }

    if (!first_root.empty()) {
        return first_root;
    }
    return model.links.front().name;
}

void UrdfParser::orderJoints(UrdfModel& model) {
    // Walk parent -> child through all joints, recording movable ones
    std::map<std::string, const UrdfJoint*> parent_to_joint;
    for (const auto& joint : model.joints) {
        if (parent_to_joint.count(joint.parent_link) == 0) {
            parent_to_joint[joint.parent_link] = &joint;
        } else {
            LOG_WARN("Link '{}' has several child joints; only '{}' is on the main chain",
                     joint.parent_link, parent_to_joint[joint.parent_link]->name);
        }
    }

    model.joint_order.clear();
    std::string current_link = model.base_link_name;

    for (size_t i = 0; i < model.joints.size(); ++i) {
        auto it = parent_to_joint.find(current_link);
        if (it == parent_to_joint.end()) break;

        if (it->second->isMovable()) {
            model.joint_order.push_back(it->second->name);
        }
        current_link = it->second->child_link;
    }
}

} // namespace config
} // namespace arm_teleop
