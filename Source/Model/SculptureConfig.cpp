#include "SculptureConfig.h"
#include <algorithm>
#include <cmath>

namespace nebula {

juce::var SculptureConfig::toVar() const
{
    auto obj = new juce::DynamicObject();
    obj->setProperty("shape", juce::String(shapeToString(shape)));
    obj->setProperty("colour", juce::String(colour));
    obj->setProperty("particle_count", particleCount);
    obj->setProperty("point_size", pointSize);
    obj->setProperty("opacity", opacity);
    obj->setProperty("refresh_hz", refreshHz);
    obj->setProperty("osc_port", oscPort);
    obj->setProperty("frame_rate_independent", frameRateIndependent);
    obj->setProperty("tracking_timeout_ms", trackingTimeoutMs);
    return juce::var(obj);
}

void SculptureConfig::fromVar(const juce::var& v)
{
    auto* obj = v.getDynamicObject();
    if (!obj) return;

    auto getNumber = [&](const char* key, double def, double lo, double hi) -> double {
        if (obj->hasProperty(key)) {
            auto p = obj->getProperty(key);
            if (p.isInt() || p.isInt64() || p.isDouble()) {
                double d = (double)p;
                if (std::isfinite(d))
                    return std::clamp(d, lo, hi);
            }
        }
        return def;
    };
    auto getBool = [&](const char* key, bool def) -> bool {
        if (obj->hasProperty(key) && obj->getProperty(key).isBool())
            return (bool)obj->getProperty(key);
        return def;
    };

    if (obj->hasProperty("shape")) {
        ShapeKind k;
        if (shapeFromString(obj->getProperty("shape").toString().toStdString(), k))
            shape = k;
        else
            DBG("[config] Unknown shape '" + obj->getProperty("shape").toString() + "', keeping "
                + juce::String(shapeToString(shape)));
    }

    if (obj->hasProperty("colour") && obj->getProperty("colour").isString())
        colour = obj->getProperty("colour").toString().toStdString();

    particleCount = (int)getNumber("particle_count", particleCount, MinParticles, MaxParticles);
    pointSize = (float)getNumber("point_size", pointSize, 0.001, 1.0);
    opacity = (float)getNumber("opacity", opacity, 0.0, 1.0);
    refreshHz = (int)getNumber("refresh_hz", refreshHz, 1, 240);
    oscPort = (int)getNumber("osc_port", oscPort, 1, 65535);
    frameRateIndependent = getBool("frame_rate_independent", frameRateIndependent);
    trackingTimeoutMs = (int)getNumber("tracking_timeout_ms", trackingTimeoutMs, 0, 60000);
}

bool SculptureConfig::save(const juce::File& file) const
{
    if (!file.replaceWithText(juce::JSON::toString(toVar()))) {
        DBG("[config] Failed to write " + file.getFullPathName());
        return false;
    }
    return true;
}

bool SculptureConfig::load(const juce::File& file)
{
    if (!file.existsAsFile()) return false;

    auto parsed = juce::JSON::parse(file.loadFileAsString());
    if (!parsed.isObject()) {
        DBG("[config] Ignoring malformed settings in " + file.getFullPathName());
        return false;
    }

    fromVar(parsed);
    return true;
}

juce::File SculptureConfig::getDefaultFile()
{
    auto dir = juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
                   .getChildFile("NebulaSculpture");
    dir.createDirectory();
    return dir.getChildFile("settings.json");
}

} // namespace nebula
