/**
 * @file TopicFormatter.cpp
 * @brief Implementation file.
 */
#include "Modules/Ebus/Format/TopicFormatter.h"
#include "Core/SystemLimits.h"
#include <math.h>
#include <string.h>
#include <stdio.h>

namespace {

struct PlaceholderName {
    const char* name;
    Placeholder token;
};

constexpr PlaceholderName kPlaceholders[] = {
    {"circuit", Placeholder::Circuit},
    {"circuit_name", Placeholder::Circuit},
    {"field_name", Placeholder::FieldName},
    {"field_value", Placeholder::FieldValue},
    {"unit", Placeholder::Unit},
    {"appliance", Placeholder::Appliance},
    {"bus", Placeholder::Bus},
};

class Writer {
public:
    Writer(char* out, size_t outLen) : out_(out), cap_(outLen) { if (cap_) out_[0] = '\0'; }

    void put(const char* s, size_t n)
    {
        for (size_t i = 0; i < n; ++i) {
            if (pos_ + 1 >= cap_) { overflow_ = true; return; }
            out_[pos_++] = s[i];
        }
        out_[pos_] = '\0';
    }
    void put(const char* s) { put(s, strlen(s)); }
    bool ok() const { return !overflow_ && cap_ > 0; }

private:
    char* out_;
    size_t cap_;
    size_t pos_ = 0;
    bool overflow_ = false;
};

}  // namespace

Placeholder placeholderFromName(const char* name, size_t len)
{
    if (!name) return Placeholder::None;
    for (const PlaceholderName& p : kPlaceholders) {
        if (strlen(p.name) == len && strncmp(p.name, name, len) == 0) return p.token;
    }
    return Placeholder::None;
}

bool formatValue(double v, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    char buf[48];
    // fixed notation stops at 1e15, beyond it 15 significant digits in exponent form
    const int n = (fabs(v) < 1e15 || !isfinite(v)) ? snprintf(buf, sizeof(buf), "%.6f", v)
                                                   : snprintf(buf, sizeof(buf), "%.15g", v);
    if (n <= 0 || (size_t)n >= sizeof(buf)) {
        out[0] = '\0';
        return false;
    }

    size_t len = (size_t)n;
    if (memchr(buf, '.', len) && !memchr(buf, 'e', len)) {
        while (len > 0 && buf[len - 1] == '0') --len;
        if (len > 0 && buf[len - 1] == '.') --len;
    }
    buf[len] = '\0';
    if (strcmp(buf, "-0") == 0) {
        buf[0] = '0';
        buf[1] = '\0';
        len = 1;
    }

    if (len >= outLen) {
        out[0] = '\0';
        return false;
    }
    memcpy(out, buf, len + 1);
    return true;
}

bool formatTopic(const char* tpl, const TemplateContext& ctx, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    Writer w(out, outLen);
    if (!tpl) return true;

    const char* p = tpl;
    while (*p != '\0') {
        if (*p != '<') {
            const char* lt = strchr(p, '<');
            const size_t n = lt ? (size_t)(lt - p) : strlen(p);
            w.put(p, n);
            p += n;
            continue;
        }

        const char* end = p + 1;
        while (*end != '\0' && *end != '>' && *end != '<') ++end;
        if (*end != '>') {
            // not a placeholder: keep the '<' and rescan from the next char
            w.put(p, 1);
            ++p;
            continue;
        }

        const char* subst = nullptr;
        char valueBuf[Limits::Mqtt::Buffers::Value];
        switch (placeholderFromName(p + 1, (size_t)(end - p - 1))) {
        case Placeholder::Circuit: subst = ctx.circuit; break;
        case Placeholder::FieldName: subst = ctx.fieldName; break;
        case Placeholder::Unit: subst = ctx.unit; break;
        case Placeholder::Appliance: subst = ctx.appliance; break;
        case Placeholder::Bus: subst = ctx.bus; break;
        case Placeholder::FieldValue:
            if (ctx.hasValue && formatValue(ctx.value, valueBuf, sizeof(valueBuf))) subst = valueBuf;
            break;
        case Placeholder::None:
            break;
        }

        if (subst) {
            w.put(subst);
        } else {
            w.put(p, (size_t)(end - p + 1));
        }
        p = end + 1;
    }
    return w.ok();
}
