#include "map_export.hpp"

#include "rng.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <ostream>
#include <sstream>

namespace procmaps {

namespace {

MapImage blankImage(int w, int h) {
    MapImage img;
    img.width = w;
    img.height = h;
    img.pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), Color{0, 0, 0, 255});
    return img;
}

char base36(int v) {
    static const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
    return digits[v % 36];
}

void writeIntList(std::ostream& out, const std::vector<int>& v) {
    out << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out << ",";
        out << v[i];
    }
    out << "]";
}

} // namespace

Color regionColor(int id) {
    if (id <= 0) return Color{0, 0, 0, 255};
    const uint32_t h = hash32(static_cast<uint32_t>(id) * 0x9e3779b9u);
    // Keep colours away from pure black so unclaimed cells stand out.
    Color c;
    c.r = static_cast<uint8_t>(48 + (h & 0xFFu) % 200);
    c.g = static_cast<uint8_t>(48 + ((h >> 8) & 0xFFu) % 200);
    c.b = static_cast<uint8_t>(48 + ((h >> 16) & 0xFFu) % 200);
    return c;
}

MapImage rasterize(const ChargeField& cf) {
    MapImage img = blankImage(cf.width(), cf.height());

    double maxV = 0.0;
    for (double v : cf.grid().cells()) maxV = std::max(maxV, v);

    for (int y = 0; y < cf.height(); ++y) {
        for (int x = 0; x < cf.width(); ++x) {
            const double v = cf.fieldAt(x, y);
            if (v == 0.0 || maxV <= 0.0) {
                img.at(x, y) = Color{16, 32, 96, 255};
                continue;
            }
            const double t = std::clamp(v / maxV, 0.0, 1.0);
            const uint8_t g = static_cast<uint8_t>(64 + std::lround(t * 191.0));
            img.at(x, y) = Color{g, g, g, 255};
        }
    }
    return img;
}

MapImage rasterize(const RandomWalk& walk) {
    MapImage img = blankImage(walk.width(), walk.height());
    for (int y = 0; y < walk.height(); ++y) {
        for (int x = 0; x < walk.width(); ++x) {
            switch (walk.tileAt(x, y)) {
                case WalkTile::Empty: break;
                case WalkTile::Floor: img.at(x, y) = Color{214, 190, 140, 255}; break;
                case WalkTile::Wall:  img.at(x, y) = Color{96, 96, 104, 255}; break;
            }
        }
    }
    return img;
}

MapImage rasterize(const RegionGrowth& rg) {
    MapImage img = blankImage(rg.width(), rg.height());
    for (int y = 0; y < rg.height(); ++y) {
        for (int x = 0; x < rg.width(); ++x) {
            img.at(x, y) = regionColor(rg.regionAt(x, y));
        }
    }
    for (const Region& r : rg.regions()) {
        img.at(r.origin.x, r.origin.y) = Color{255, 0, 0, 255};
    }
    return img;
}

std::string toAscii(const ChargeField& cf) {
    std::string out;
    out.reserve(static_cast<size_t>((cf.width() + 1) * cf.height()));
    const double high = cf.cutoff() * 2.0;
    for (int y = 0; y < cf.height(); ++y) {
        for (int x = 0; x < cf.width(); ++x) {
            const double v = cf.fieldAt(x, y);
            if (v == 0.0) out.push_back('.');
            else if (cf.cutoff() > 0.0 && v >= high) out.push_back('#');
            else out.push_back('+');
        }
        out.push_back('\n');
    }
    return out;
}

std::string toAscii(const RandomWalk& walk) {
    std::string out;
    out.reserve(static_cast<size_t>((walk.width() + 1) * walk.height()));
    for (int y = 0; y < walk.height(); ++y) {
        for (int x = 0; x < walk.width(); ++x) {
            switch (walk.tileAt(x, y)) {
                case WalkTile::Empty: out.push_back(' '); break;
                case WalkTile::Floor: out.push_back('.'); break;
                case WalkTile::Wall:  out.push_back('#'); break;
            }
        }
        out.push_back('\n');
    }
    return out;
}

std::string toAscii(const RegionGrowth& rg) {
    std::string out;
    out.reserve(static_cast<size_t>((rg.width() + 1) * rg.height()));
    for (int y = 0; y < rg.height(); ++y) {
        for (int x = 0; x < rg.width(); ++x) {
            const int id = rg.regionAt(x, y);
            out.push_back(id == kUnclaimed ? '?' : base36(id));
        }
        out.push_back('\n');
    }
    return out;
}

bool writePpm(const std::string& path, const MapImage& img, int scale, std::string* err) {
    if (img.width <= 0 || img.height <= 0) {
        if (err) *err = "Refusing to write an empty image";
        return false;
    }
    scale = clampi(scale, 1, 64);

    std::ofstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "Unable to open output file: " + path;
        return false;
    }

    const int outW = img.width * scale;
    const int outH = img.height * scale;
    f << "P6\n" << outW << " " << outH << "\n255\n";

    std::vector<char> row(static_cast<size_t>(outW) * 3u);
    for (int y = 0; y < img.height; ++y) {
        for (int x = 0; x < img.width; ++x) {
            const Color& c = img.at(x, y);
            for (int s = 0; s < scale; ++s) {
                const size_t o = static_cast<size_t>((x * scale + s) * 3);
                row[o + 0] = static_cast<char>(c.r);
                row[o + 1] = static_cast<char>(c.g);
                row[o + 2] = static_cast<char>(c.b);
            }
        }
        for (int s = 0; s < scale; ++s) {
            f.write(row.data(), static_cast<std::streamsize>(row.size()));
        }
    }

    if (!f) {
        if (err) *err = "Failed writing image: " + path;
        return false;
    }
    return true;
}

std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

void writeJsonSummary(std::ostream& out, const ChargeField& cf) {
    int positives = 0;
    for (const Charge& c : cf.charges()) {
        if (c.polarity > 0) ++positives;
    }
    out << "{\n"
        << "  \"generator\": \"charge\",\n"
        << "  \"width\": " << cf.width() << ",\n"
        << "  \"height\": " << cf.height() << ",\n"
        << "  \"positive_charges\": " << positives << ",\n"
        << "  \"negative_charges\": " << (static_cast<int>(cf.charges().size()) - positives) << ",\n"
        << "  \"charge_strength\": " << cf.chargeStrength() << ",\n"
        << "  \"mean\": " << cf.meanField() << ",\n"
        << "  \"cutoff\": " << cf.cutoff() << ",\n"
        << "  \"land_cells\": " << cf.landCount() << "\n"
        << "}\n";
}

void writeJsonSummary(std::ostream& out, const RandomWalk& walk) {
    out << "{\n"
        << "  \"generator\": \"walk\",\n"
        << "  \"width\": " << walk.width() << ",\n"
        << "  \"height\": " << walk.height() << ",\n"
        << "  \"floor\": " << walk.countTiles(WalkTile::Floor) << ",\n"
        << "  \"wall\": " << walk.countTiles(WalkTile::Wall) << ",\n"
        << "  \"empty\": " << walk.countTiles(WalkTile::Empty) << ",\n"
        << "  \"cursor\": [" << walk.cursor().x << "," << walk.cursor().y << "],\n"
        << "  \"stuck\": " << (walk.canWalk() ? "false" : "true") << "\n"
        << "}\n";
}

void writeJsonSummary(std::ostream& out, const RegionGrowth& rg) {
    out << "{\n"
        << "  \"generator\": \"regions\",\n"
        << "  \"width\": " << rg.width() << ",\n"
        << "  \"height\": " << rg.height() << ",\n"
        << "  \"rounds\": " << rg.rounds() << ",\n"
        << "  \"regions\": [";
    for (size_t i = 0; i < rg.regions().size(); ++i) {
        const Region& r = rg.regions()[i];
        out << (i ? ",\n" : "\n")
            << "    {\"id\": " << r.id
            << ", \"origin\": [" << r.origin.x << "," << r.origin.y << "]"
            << ", \"cells\": " << r.positions.size()
            << ", \"neighbors\": ";
        writeIntList(out, r.neighbors);
        out << "}";
    }
    out << (rg.regions().empty() ? "]\n" : "\n  ]\n") << "}\n";
}

} // namespace procmaps
