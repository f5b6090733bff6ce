#ifndef NWSS_TESS_PAINT_H
#define NWSS_TESS_PAINT_H

#include <cstdint>
#include <string>

namespace nwss {
namespace tess {

/**
 * 8-bit RGBA colour
 */
struct Color {
    uint8_t r;
    uint8_t g;
    uint8_t b;
    uint8_t a;

    Color(uint8_t _r = 0, uint8_t _g = 0, uint8_t _b = 0, uint8_t _a = 255)
        : r(_r), g(_g), b(_b), a(_a) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }
};

/**
 * Fill or stroke colour source
 */
class Paint {
public:
    enum class Type {
        NONE,           // Nothing is painted
        SOLID,          // A literal RGBA colour
        GRADIENT        // Reference to a gradient by id
    };

    // Default paint is NONE
    Paint();

    static Paint none();
    static Paint solid(const Color& color);
    static Paint solid(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);
    static Paint gradient(const std::string& id);

    Type getType() const { return m_type; }

    bool isNone() const { return m_type == Type::NONE; }
    bool isSolid() const { return m_type == Type::SOLID; }
    bool isGradient() const { return m_type == Type::GRADIENT; }

    // Only meaningful for SOLID paints
    const Color& getColor() const { return m_color; }

    // Only meaningful for GRADIENT paints
    const std::string& getGradientId() const { return m_gradientId; }

    /**
     * Scale the alpha channel of a solid paint, truncating to a byte.
     * Other paint types are returned unchanged.
     */
    Paint withOpacity(double opacity) const;

    // Fully transparent solid colour
    bool isTransparent() const { return isSolid() && m_color.a == 0; }

    std::string toString() const;

    bool operator==(const Paint& other) const;
    bool operator!=(const Paint& other) const { return !(*this == other); }

private:
    Type m_type;
    Color m_color;
    std::string m_gradientId;
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_PAINT_H
