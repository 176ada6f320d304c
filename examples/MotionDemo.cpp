#include "config/Config.hpp"
#include "config/MotionSettings.hpp"
#include "core/Logger.hpp"
#include "motion/MotionEngine.hpp"
#include "motion/MotionTarget.hpp"
#include "platform/SteadyFrameSource.hpp"

#include <map>
#include <string>
#include <vector>

namespace {

/**
 * @brief Minimal in-memory node that logs every style write
 */
class ConsoleTarget : public Kinetic::IMotionTarget {
public:
    explicit ConsoleTarget(std::string name) : m_name(std::move(name)) {}

    std::string GetComputedValue(const std::string& property) const override {
        auto it = m_styles.find(property);
        return it != m_styles.end() ? it->second : std::string();
    }

    void SetStyle(const std::string& property, const std::string& value) override {
        m_styles[property] = value;
        APP_LOG_TRACE("{}: {} = {}", m_name, property, value);
    }

    Kinetic::Rect GetBoundingRect() const override { return m_rect; }
    void SetBoundingRect(const Kinetic::Rect& rect) { m_rect = rect; }

    void FlushStyles() override {}

    Kinetic::ListenerId AddEventListener(Kinetic::InteractionEvent event, std::function<void()> handler) override {
        const Kinetic::ListenerId id = m_nextListenerId++;
        m_listeners[id] = {event, std::move(handler)};
        return id;
    }

    void RemoveEventListener(Kinetic::ListenerId listenerId) override {
        m_listeners.erase(listenerId);
    }

    std::vector<Kinetic::IMotionTarget*> QuerySelectorAll(const std::string&) override {
        return m_children;
    }

    void AddChild(ConsoleTarget& child) { m_children.push_back(&child); }

    void Fire(Kinetic::InteractionEvent event) {
        for (auto& [id, listener] : m_listeners) {
            if (listener.first == event) {
                listener.second();
            }
        }
    }

    void Print() const {
        for (const auto& [property, value] : m_styles) {
            APP_LOG_INFO("  {} {}: {}", m_name, property, value);
        }
    }

private:
    std::string m_name;
    std::map<std::string, std::string> m_styles;
    Kinetic::Rect m_rect;
    std::map<Kinetic::ListenerId, std::pair<Kinetic::InteractionEvent, std::function<void()>>> m_listeners;
    Kinetic::ListenerId m_nextListenerId = 1;
    std::vector<Kinetic::IMotionTarget*> m_children;
};

void LogOutcome(const char* label, const Kinetic::MotionCompletion& completion) {
    const auto outcome = completion.GetOutcome();
    APP_LOG_INFO("{}: {}", label, outcome ? Kinetic::MotionOutcomeToString(*outcome) : "pending");
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Kinetic::Config config;
    const std::string configPath = argc > 1 ? argv[1] : "config/motion.json";
    const auto loaded = config.Load(configPath);

    Kinetic::LogSettings logging = Kinetic::LogSettings::FromConfig(config);
    if (logging.file.empty()) {
        logging.file = "kinetic_demo.log";
    }
    Kinetic::Logger::Initialize(logging);
    APP_LOG_INFO("Starting Kinetic motion demo");
    if (!loaded) {
        APP_LOG_WARN("Using built-in motion settings: {}", Kinetic::ConfigErrorToString(loaded.error()));
    }

    Kinetic::MotionSettings settings = Kinetic::MotionSettings::FromConfig(config);
    settings.monitoring = true;

    Kinetic::SteadyFrameSource frames(settings.targetFps);
    Kinetic::MotionEngine engine(frames, settings);

    // Spring and tween on one card
    ConsoleTarget card("card");
    Kinetic::SpringOptions bouncy;
    bouncy.preset = Kinetic::SpringPreset::Bouncy;
    auto cardSpring = engine.Spring(card, {{"left", Kinetic::PropertyValue::FromNumber(240.0f)}}, bouncy);

    Kinetic::TweenOptions fade;
    fade.durationMs = 400.0f;
    fade.easing = Kinetic::Easing::EaseOutCubic;
    auto cardFade = engine.Tween(card, {{"opacity", Kinetic::PropertyValue::FromNumber(0.4f)}}, fade);

    // Staggered list
    ConsoleTarget list("list");
    std::vector<ConsoleTarget> items;
    items.reserve(4);
    for (int i = 0; i < 4; ++i) {
        items.emplace_back("item" + std::to_string(i));
    }
    for (auto& item : items) {
        list.AddChild(item);
    }
    auto listIn = engine.Stagger(list, ".item", {{"top", Kinetic::PropertyValue::FromNumber(0.0f)},
                                                 {"opacity", Kinetic::PropertyValue::FromNumber(1.0f)}});

    // Layout change
    ConsoleTarget panel("panel");
    panel.SetBoundingRect({glm::vec2(0.0f, 0.0f), glm::vec2(320.0f, 200.0f)});
    auto panelMove = engine.Layout(panel, [&panel]() {
        panel.SetBoundingRect({glm::vec2(40.0f, 120.0f), glm::vec2(640.0f, 200.0f)});
    });

    // Hover gesture
    ConsoleTarget button("button");
    Kinetic::GestureMap gestures;
    gestures.initial = Kinetic::PropertySet{{"scale", Kinetic::PropertyValue::FromNumber(1.0f)}};
    gestures.hover = Kinetic::PropertySet{{"scale", Kinetic::PropertyValue::FromNumber(1.08f)}};
    Kinetic::GestureBinding hover = engine.Gesture(button, gestures);
    button.Fire(Kinetic::InteractionEvent::PointerEnter);

    const size_t frameCount = frames.RunUntilIdle();
    APP_LOG_INFO("Motion loop idle after {} frames", frameCount);

    LogOutcome("card spring", cardSpring);
    LogOutcome("card fade", cardFade);
    LogOutcome("list stagger", listIn);
    LogOutcome("panel layout", panelMove);

    card.Print();
    for (const auto& item : items) {
        item.Print();
    }
    panel.Print();
    button.Print();

    hover.Detach();
    engine.Destroy();

    APP_LOG_INFO("Kinetic motion demo finished");
    Kinetic::Logger::Shutdown();
    return 0;
}
