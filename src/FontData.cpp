#include "FontData.hpp"
#include <include/core/SkFontStyle.h>

#ifdef __APPLE__
    #include <include/ports/SkFontMgr_mac_ct.h>
#elif _WIN32
    #include <include/ports/SkTypeface_win.h>
#else
    #include <include/ports/SkFontMgr_fontconfig.h>
    #include <include/ports/SkFontScanner_FreeType.h>
#endif

#include "Logger.hpp"

FontData::FontData()
{
#ifdef __APPLE__
    defaultFontMgr = SkFontMgr_New_CoreText(nullptr);
#elif _WIN32
    defaultFontMgr = SkFontMgr_New_DirectWrite();
#else
    defaultFontMgr = SkFontMgr_New_FontConfig(nullptr, SkFontScanner_Make_FreeType());
#endif
    if(!defaultFontMgr) {
        Logger::get().log("INFO", "[FontData::FontData] Could not create platform font manager, text will use the default typeface");
        defaultFontMgr = SkFontMgr::RefEmpty();
    }
}

FontData::FontData(sk_sp<SkFontMgr> initFontMgr):
    defaultFontMgr(initFontMgr ? initFontMgr : SkFontMgr::RefEmpty())
{}

sk_sp<SkTypeface> FontData::get_typeface(const std::string& family, int weight) {
    std::string key = family + "/" + std::to_string(weight);
    auto it = map.find(key);
    if(it != map.end())
        return it->second;

    SkFontStyle style(weight, SkFontStyle::kNormal_Width, SkFontStyle::kUpright_Slant);
    sk_sp<SkTypeface> typeface = defaultFontMgr->matchFamilyStyle(family.c_str(), style);
    if(!typeface)
        typeface = defaultFontMgr->legacyMakeTypeface(nullptr, style);
    if(!typeface)
        Logger::get().log("INFO", "[FontData::get_typeface] No typeface for family " + family + ", using default");

    map[key] = typeface;
    return typeface;
}

SkFont FontData::get_font(const DrawingOptions& options) {
    SkFont font(get_typeface(options.fontFamily, options.fontWeight), options.fontSize);
    font.setEdging(SkFont::Edging::kAntiAlias);
    return font;
}

FontData::~FontData() {
}

float measure_text_width(const SkFont& font, const std::string& str) {
    return font.measureText(str.data(), str.length(), SkTextEncoding::kUTF8, nullptr);
}

