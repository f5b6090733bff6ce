#include "nwss-tess/paint.h"
#include <algorithm>
#include <sstream>

namespace nwss {
namespace tess {

Paint::Paint() : m_type(Type::NONE), m_color(0, 0, 0, 0) {}

Paint Paint::none() {
    return Paint();
}

Paint Paint::solid(const Color& color) {
    Paint paint;
    paint.m_type = Type::SOLID;
    paint.m_color = color;
    return paint;
}

Paint Paint::solid(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return solid(Color(r, g, b, a));
}

Paint Paint::gradient(const std::string& id) {
    Paint paint;
    paint.m_type = Type::GRADIENT;
    paint.m_gradientId = id;
    return paint;
}

Paint Paint::withOpacity(double opacity) const {
    if (m_type != Type::SOLID) {
        return *this;
    }

    double alpha = std::max(0.0, std::min(1.0, opacity)) * m_color.a;
    Color color = m_color;
    color.a = static_cast<uint8_t>(alpha);
    return solid(color);
}

std::string Paint::toString() const {
    std::stringstream ss;
    switch (m_type) {
        case Type::NONE:
            ss << "none";
            break;
        case Type::SOLID:
            ss << "rgba(" << static_cast<int>(m_color.r) << "," << static_cast<int>(m_color.g)
               << "," << static_cast<int>(m_color.b) << "," << static_cast<int>(m_color.a) << ")";
            break;
        case Type::GRADIENT:
            ss << "url(#" << m_gradientId << ")";
            break;
    }
    return ss.str();
}

bool Paint::operator==(const Paint& other) const {
    if (m_type != other.m_type) {
        return false;
    }

    switch (m_type) {
        case Type::NONE:
            return true;
        case Type::SOLID:
            return m_color == other.m_color;
        case Type::GRADIENT:
            return m_gradientId == other.m_gradientId;
    }
    return false;
}

} // namespace tess
} // namespace nwss
