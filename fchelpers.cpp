#include "fchelpers.hpp"
#include <fontconfig/fontconfig.h>
#include <cstdio>
#include <cstring>
#include <strings.h>

namespace {

// fontconfig falls back to a "close enough" family when the requested
// one does not exist. Report it so the user knows the output will not
// look as configured.
void check_substitution(FcPattern *match, const std::string &family) {
    FcChar8 *matched_family = nullptr;
    if(FcPatternGetString(match, FC_FAMILY, 0, &matched_family) != FcResultMatch) {
        return;
    }
    if(strcasecmp((const char *)matched_family, family.c_str()) != 0) {
        fprintf(stderr,
                "Font family \"%s\" not found, using \"%s\" instead.\n",
                family.c_str(),
                (const char *)matched_family);
    }
}

} // namespace

std::optional<std::filesystem::path> find_font_file(const std::string &family) {
    if(!FcInit()) {
        fprintf(stderr, "Could not initialize fontconfig.\n");
        return {};
    }
    FcPattern *pattern = FcNameParse((const FcChar8 *)family.c_str());
    if(!pattern) {
        return {};
    }
    FcPatternAddBool(pattern, FC_SCALABLE, FcTrue);
    FcConfigSubstitute(nullptr, pattern, FcMatchPattern);
    FcDefaultSubstitute(pattern);

    FcResult result;
    FcPattern *match = FcFontMatch(nullptr, pattern, &result);
    FcPatternDestroy(pattern);
    if(!match) {
        return {};
    }
    check_substitution(match, family);

    std::optional<std::filesystem::path> found;
    FcChar8 *file = nullptr;
    if(FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch) {
        found = std::filesystem::path((const char *)file);
    }
    FcPatternDestroy(match);
    return found;
}
