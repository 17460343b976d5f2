#pragma once
#include "SharedTypes.hpp"
#include "DrawingTools/ToolManager.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct FontData;
class ToolConfiguration;

// Owns the finished objects and turns press/move/release into tool manager calls
class CanvasHost {
    public:
        CanvasHost(ToolManager& initToolMan, FontData* initFonts = nullptr);

        DrawingOptions options;

        void apply_config(const ToolConfiguration& config);

        void press(const Vector2f& p);
        void move(const Vector2f& p);
        // Returns the object that was added, if any
        std::shared_ptr<DrawingObject> release(const Vector2f& p);
        void cancel();
        bool is_drawing() const;
        const std::shared_ptr<DrawingObject>& get_object_being_drawn() const;

        bool update_text(const std::string& id, const std::string& text);
        const std::optional<std::string>& get_editing_text_id() const;
        void finish_text_editing();

        std::shared_ptr<DrawingObject> object_at(const Vector2f& p) const;
        std::shared_ptr<DrawingObject> get_object(const std::string& id) const;
        const std::vector<std::shared_ptr<DrawingObject>>& get_objects() const;
        bool remove_object(const std::string& id);
        const std::optional<std::string>& get_selected_id() const;

        // Finished objects in insertion order, then the object being drawn on top
        void render_all(SkCanvas* canvas);

        ToolContext make_context(SkCanvas* canvas = nullptr);

        unsigned get_redraw_request_count() const;
        unsigned get_checkpoint_count() const;

    private:
        ToolManager& toolMan;
        FontData* fonts;

        std::vector<std::shared_ptr<DrawingObject>> objects;
        std::map<DrawingToolType, float> hitMargins;

        std::shared_ptr<DrawingObject> objBeingDrawn;
        Vector2f pressPos{0.0f, 0.0f};
        bool movedSincePress = false;

        std::optional<std::string> editingTextId;
        std::optional<std::string> selectedId;

        unsigned redrawRequests = 0;
        unsigned checkpoints = 0;
};
