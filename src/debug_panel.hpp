#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel: provider registry for the debug overlay.
//
// Stored as a World resource. DebugModule inserts it with the engine rows;
// game modules append their own rows with watch(section, label, fn) if the
// resource exists. DebugSystem draws snapshot() each frame while visible.
//
// Zero engine dependencies, safe to include in any target.
// ---------------------------------------------------------------------------

struct DebugPanel {
    using Provider = std::function<std::string()>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Section {
        std::string      title;
        std::vector<Row> rows;
    };

    // One evaluated section, ready to draw.
    struct SectionValues {
        std::string                                      title;
        std::vector<std::pair<std::string, std::string>> rows; // label, value
    };

    bool visible = false;

    // Creates the section on first use. A label already present in the
    // section has its provider replaced.
    void watch(const std::string& section, const std::string& label, Provider fn) {
        for (auto& s : sections_) {
            if (s.title != section) continue;
            for (auto& r : s.rows) {
                if (r.label == label) {
                    r.fn = std::move(fn);
                    return;
                }
            }
            s.rows.push_back({label, std::move(fn)});
            return;
        }
        sections_.push_back({section, {{label, std::move(fn)}}});
    }

    void toggle() { visible = !visible; }

    std::size_t row_count() const {
        std::size_t n = 0;
        for (const auto& s : sections_) n += s.rows.size();
        return n;
    }

    // Calls every provider once, in registration order.
    std::vector<SectionValues> snapshot() const {
        std::vector<SectionValues> out;
        out.reserve(sections_.size());
        for (const auto& s : sections_) {
            SectionValues v{s.title, {}};
            for (const auto& r : s.rows) v.rows.emplace_back(r.label, r.fn ? r.fn() : "-");
            out.push_back(std::move(v));
        }
        return out;
    }

    // Value of one row, or "-" if it is not registered.
    std::string value(const std::string& section, const std::string& label) const {
        for (const auto& s : sections_)
            if (s.title == section)
                for (const auto& r : s.rows)
                    if (r.label == label && r.fn) return r.fn();
        return "-";
    }

    const std::vector<Section>& sections() const { return sections_; }

private:
    std::vector<Section> sections_;
};
