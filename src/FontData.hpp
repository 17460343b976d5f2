#pragma once
#include <include/core/SkFontMgr.h>
#include <include/core/SkTypeface.h>
#include <include/core/SkFont.h>
#include <string>
#include <unordered_map>
#include "SharedTypes.hpp"
#include "DrawingObjects/DrawingOptions.hpp"

struct FontData {
    FontData();
    FontData(sk_sp<SkFontMgr> initFontMgr);
    sk_sp<SkFontMgr> defaultFontMgr;
    std::unordered_map<std::string, sk_sp<SkTypeface>> map;

    // nullptr when neither the family nor a fallback can be resolved
    sk_sp<SkTypeface> get_typeface(const std::string& family, int weight);
    SkFont get_font(const DrawingOptions& options);
    ~FontData();
};

float measure_text_width(const SkFont& font, const std::string& str);
