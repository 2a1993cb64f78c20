#include "stride/core/CharacterTypes.hh"

namespace stride {

std::string castTypeToString(CastType type) {
    switch (type) {
        case CastType::Raycast:      return "raycast";
        case CastType::RaycastArray: return "raycastArray";
        case CastType::Spherecast:   return "spherecast";
        default:                     return "unknown";
    }
}

std::string ceilingMethodToString(CeilingDetectionMethod method) {
    switch (method) {
        case CeilingDetectionMethod::OnlyCheckFirstContact:     return "onlyCheckFirstContact";
        case CeilingDetectionMethod::CheckAllContacts:          return "checkAllContacts";
        case CeilingDetectionMethod::CheckAverageOfAllContacts: return "checkAverageOfAllContacts";
        default:                                                return "unknown";
    }
}

std::string colliderKindToString(ColliderKind kind) {
    switch (kind) {
        case ColliderKind::Box:     return "box";
        case ColliderKind::Sphere:  return "sphere";
        case ColliderKind::Capsule: return "capsule";
        default:                    return "unknown";
    }
}

std::optional<CastType> castTypeFromString(std::string_view name) {
    if (name == "raycast")
        return CastType::Raycast;
    if (name == "raycastArray")
        return CastType::RaycastArray;
    if (name == "spherecast")
        return CastType::Spherecast;
    return std::nullopt;
}

std::optional<CeilingDetectionMethod> ceilingMethodFromString(std::string_view name) {
    if (name == "onlyCheckFirstContact")
        return CeilingDetectionMethod::OnlyCheckFirstContact;
    if (name == "checkAllContacts")
        return CeilingDetectionMethod::CheckAllContacts;
    if (name == "checkAverageOfAllContacts")
        return CeilingDetectionMethod::CheckAverageOfAllContacts;
    return std::nullopt;
}

std::optional<ColliderKind> colliderKindFromString(std::string_view name) {
    if (name == "box")
        return ColliderKind::Box;
    if (name == "sphere")
        return ColliderKind::Sphere;
    if (name == "capsule")
        return ColliderKind::Capsule;
    return std::nullopt;
}

} // namespace stride
