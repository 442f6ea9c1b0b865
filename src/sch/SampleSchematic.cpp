#include "sch/SampleSchematic.hpp"

#include <utility>
#include <vector>

#include "utils/ColorUtils.hpp"

std::shared_ptr<Schematic> CreateSampleSchematic()
{
    auto schematic = std::make_shared<Schematic>();
    schematic->title = "Sample sheet";

    // Sheet frame
    Stroke frame_stroke;
    frame_stroke.width = 0.254;
    schematic->Add(std::make_unique<SchematicRectangle>(Vec2(0, 0), Vec2(297, 210), frame_stroke));

    // Power rail with a tap and an open pin
    schematic->Add(std::make_unique<Wire>(std::vector<Vec2> {{50.8, 50.8}, {101.6, 50.8}, {101.6, 76.2}}));
    schematic->Add(std::make_unique<Wire>(std::vector<Vec2> {{76.2, 50.8}, {76.2, 63.5}}));
    schematic->Add(std::make_unique<Junction>(Vec2(76.2, 50.8)));
    schematic->Add(std::make_unique<NoConnect>(Vec2(76.2, 63.5)));
    schematic->Add(std::make_unique<NetLabel>("VCC", Vec2(55.88, 50.8)));
    schematic->Add(std::make_unique<NetLabel>("CLK", Vec2(101.6, 71.12), 90.0));

    // Data bus
    schematic->Add(std::make_unique<Bus>(std::vector<Vec2> {{127.0, 50.8}, {127.0, 101.6}}));
    schematic->Add(std::make_unique<BusEntry>(Vec2(127.0, 60.96), Vec2(2.54, 2.54)));
    schematic->Add(std::make_unique<BusEntry>(Vec2(127.0, 66.04), Vec2(2.54, 2.54)));
    schematic->Add(std::make_unique<Wire>(std::vector<Vec2> {{129.54, 63.5}, {139.7, 63.5}}));
    schematic->Add(std::make_unique<Wire>(std::vector<Vec2> {{129.54, 68.58}, {139.7, 68.58}}));
    schematic->Add(std::make_unique<NetLabel>("D0", Vec2(132.08, 63.5)));
    schematic->Add(std::make_unique<NetLabel>("D1", Vec2(132.08, 68.58)));

    auto& big_junction = schematic->Add(std::make_unique<Junction>(Vec2(101.6, 76.2), 1.27));
    big_junction.color = color_utils::ParseCssColor("#ff8000");

    // Notes and graphics
    Stroke dashed;
    dashed.type = StrokeType::kDash;
    schematic->Add(std::make_unique<SchematicPolyline>(std::vector<Vec2> {{38.1, 38.1}, {152.4, 38.1}, {152.4, 114.3}, {38.1, 114.3}, {38.1, 38.1}}, dashed));

    Fill body;
    body.type = FillType::kBackground;
    schematic->Add(std::make_unique<SchematicRectangle>(Vec2(177.8, 50.8), Vec2(203.2, 76.2), Stroke {}, body));

    Fill outline;
    outline.type = FillType::kOutline;
    schematic->Add(std::make_unique<SchematicCircle>(Vec2(190.5, 101.6), 5.08, Stroke {}, outline));

    Stroke red;
    red.width = 0.3;
    red.color = color_utils::ParseCssColor("rgb(200, 40, 40)");
    schematic->Add(std::make_unique<SchematicArc>(Vec2(215.9, 101.6), Vec2(226.06, 91.44), Vec2(236.22, 101.6), red));

    auto& note = schematic->Add(std::make_unique<SchematicText>("Power input", Vec2(50.8, 45.72)));
    note.options.h_align = TextHAlign::kLeft;
    schematic->Add(std::make_unique<SchematicText>("Vertical note", Vec2(165.1, 76.2), 90.0));

    auto& hidden = schematic->Add(std::make_unique<SchematicText>("hidden", Vec2(10, 10)));
    hidden.hidden = true;

    return schematic;
}
