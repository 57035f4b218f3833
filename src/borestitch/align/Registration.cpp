#include "borestitch/align/Registration.hpp"

namespace borestitch {

namespace {
// overload set for std::visit
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

double rawDy(const RegistrationResult& r) {
    return std::visit(overloaded{
        [](const AffineFit& f)      { return f.transform.dy(); },
        [](const TranslationFit& f) { return f.transform.dy(); },
        [](const TemplateFit& f)    { return f.dy; },
        [](const NoFit&)            { return 0.0; }
    }, r);
}

double placementDy(const RegistrationResult& r, bool invertVertical) {
    const double dy = rawDy(r);
    if (dy == 0.0) return 0.0;
    return invertVertical ? -dy : dy;
}

double confidence(const RegistrationResult& r) {
    return std::visit(overloaded{
        [](const AffineFit& f)      { return f.inlierRatio; },
        [](const TranslationFit& f) { return f.inlierRatio; },
        [](const TemplateFit& f)    { return f.score; },
        [](const NoFit&)            { return 0.0; }
    }, r);
}

const char* kindName(const RegistrationResult& r) {
    switch (r.index()) {
        case 0: return "affine";
        case 1: return "translation";
        case 2: return "template";
        default: return "none";
    }
}

} // namespace borestitch
