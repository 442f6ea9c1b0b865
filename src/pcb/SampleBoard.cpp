#include "pcb/SampleBoard.hpp"

#include <string>
#include <utility>
#include <vector>

#include "pcb/elements/Footprint.hpp"
#include "pcb/elements/Graphics.hpp"
#include "pcb/elements/Pad.hpp"
#include "pcb/elements/Trace.hpp"
#include "pcb/elements/Via.hpp"
#include "pcb/elements/Zone.hpp"

namespace
{
constexpr int kNetGnd = 1;
constexpr int kNetVcc = 2;
constexpr int kNetClk = 3;

void AddLayers(Board& board)
{
    using LayerType = Board::LayerInfo::LayerType;

    board.AddLayer({0, "F.Cu", LayerType::kSignal});
    board.AddLayer({1, "In1.Cu", LayerType::kPower});
    board.AddLayer({2, "In2.Cu", LayerType::kPower});
    board.AddLayer({31, "B.Cu", LayerType::kSignal});
    board.AddLayer({32, "B.Adhes", LayerType::kUser, "B.Adhesive"});
    board.AddLayer({33, "F.Adhes", LayerType::kUser, "F.Adhesive"});
    board.AddLayer({34, "B.Paste", LayerType::kUser});
    board.AddLayer({35, "F.Paste", LayerType::kUser});
    board.AddLayer({36, "B.SilkS", LayerType::kUser, "B.Silkscreen"});
    board.AddLayer({37, "F.SilkS", LayerType::kUser, "F.Silkscreen"});
    board.AddLayer({38, "B.Mask", LayerType::kUser});
    board.AddLayer({39, "F.Mask", LayerType::kUser});
    board.AddLayer({40, "Dwgs.User", LayerType::kUser, "User.Drawings"});
    board.AddLayer({44, "Edge.Cuts", LayerType::kUser});
    board.AddLayer({46, "B.CrtYd", LayerType::kUser, "B.Courtyard"});
    board.AddLayer({47, "F.CrtYd", LayerType::kUser, "F.Courtyard"});
    board.AddLayer({48, "B.Fab", LayerType::kUser});
    board.AddLayer({49, "F.Fab", LayerType::kUser});
}

void AddNets(Board& board)
{
    board.AddNet(Net(0, ""));
    board.AddNet(Net(kNetGnd, "GND"));
    board.AddNet(Net(kNetVcc, "VCC"));
    board.AddNet(Net(kNetClk, "/MCU/CLK"));
}

std::unique_ptr<Pad> MakeSmdPad(const std::string& number, Vec2 position, Vec2 size, int net, const std::string& net_name)
{
    auto pad = std::make_unique<Pad>(number, PadType::kSmd, PadShape::kRoundRect, position, size, std::vector<std::string> {"F.Cu", "F.Paste", "F.Mask"}, net, net_name);
    pad->roundrect_rratio = 0.25;
    return pad;
}

void AddSoic(Board& board)
{
    auto footprint = std::make_unique<Footprint>("U1", "NE555", Vec2(20, 12));

    // Pins 1-4 down the left side, 5-8 up the right side.
    const std::vector<std::pair<int, std::string>> nets = {
        {kNetGnd, "GND"}, {kNetClk, "/MCU/CLK"}, {0, ""}, {kNetVcc, "VCC"}, {0, ""}, {kNetClk, "/MCU/CLK"}, {0, ""}, {kNetVcc, "VCC"}};
    for (int i = 0; i < 8; ++i) {
        bool const left = i < 4;
        double const y = left ? -1.905 + (1.27 * i) : 1.905 - (1.27 * (i - 4));
        auto const& [net, name] = nets[static_cast<size_t>(i)];
        footprint->Add(MakeSmdPad(std::to_string(i + 1), Vec2(left ? -2.475 : 2.475, y), Vec2(1.95, 0.6), net, name));
    }

    footprint->Add(std::make_unique<GraphicRect>(Vec2(-1.95, -2.45), Vec2(1.95, 2.45), "F.Fab", Stroke {0.1}));
    footprint->Add(std::make_unique<GraphicRect>(Vec2(-3.7, -2.7), Vec2(3.7, 2.7), "F.CrtYd", Stroke {0.05}));
    footprint->Add(std::make_unique<GraphicLine>(Vec2(-1.95, -3.0), Vec2(1.95, -3.0), "F.SilkS", Stroke {0.12}));
    footprint->Add(std::make_unique<GraphicCircle>(Vec2(-1.2, -1.7), Vec2(-1.0, -1.7), "F.Fab", Stroke {0.1}, true));

    auto& reference = footprint->Add(std::make_unique<GraphicText>("U1", Vec2(0, -3.9), "F.SilkS"));
    reference.keep_upright = true;
    auto& value = footprint->Add(std::make_unique<GraphicText>("NE555", Vec2(0, 3.9), "F.Fab"));
    value.keep_upright = true;

    board.Add(std::move(footprint));
}

void AddConnector(Board& board)
{
    auto footprint = std::make_unique<Footprint>("J1", "Conn_01x02", Vec2(6, 12), 90.0);

    auto pin1 = std::make_unique<Pad>("1", PadType::kThruHole, PadShape::kRect, Vec2(0, 0), Vec2(1.7, 1.7), std::vector<std::string> {"*.Cu", "*.Mask"}, kNetVcc, "VCC");
    pin1->rotation = 90;
    pin1->drill = PadDrill {false, 1.0};
    footprint->Add(std::move(pin1));

    auto pin2 = std::make_unique<Pad>("2", PadType::kThruHole, PadShape::kOval, Vec2(0, 2.54), Vec2(1.7, 2.2), std::vector<std::string> {"*.Cu", "*.Mask"}, kNetGnd, "GND");
    pin2->rotation = 90;
    pin2->drill = PadDrill {true, 1.0, 1.4};
    footprint->Add(std::move(pin2));

    footprint->Add(std::make_unique<GraphicRect>(Vec2(-1.33, -1.33), Vec2(1.33, 3.87), "F.SilkS", Stroke {0.12, StrokeType::kDash}));
    auto& reference = footprint->Add(std::make_unique<GraphicText>("J1", Vec2(0, -2.33), "F.SilkS", 90.0));
    reference.keep_upright = true;

    board.Add(std::move(footprint));
}

void AddResistor(Board& board)
{
    auto footprint = std::make_unique<Footprint>("R1", "10k", Vec2(34, 12), 90.0);

    auto pad1 = std::make_unique<Pad>("1", PadType::kSmd, PadShape::kOval, Vec2(-0.9, 0), Vec2(1.0, 1.3), std::vector<std::string> {"F.Cu", "F.Paste", "F.Mask"}, kNetClk, "/MCU/CLK");
    pad1->rotation = 90;
    footprint->Add(std::move(pad1));

    auto pad2 = std::make_unique<Pad>("2", PadType::kSmd, PadShape::kTrapezoid, Vec2(0.9, 0), Vec2(1.0, 1.3), std::vector<std::string> {"F.Cu", "F.Paste", "F.Mask"}, kNetVcc, "VCC");
    pad2->rotation = 90;
    pad2->rect_delta = Vec2(0, 0.2);
    footprint->Add(std::move(pad2));

    footprint->Add(std::make_unique<GraphicPoly>(std::vector<Vec2> {{-0.5, -0.8}, {0.5, -0.8}, {0.5, 0.8}, {-0.5, 0.8}}, "F.Fab", Stroke {0.1}, false));

    board.Add(std::move(footprint));
}

void AddMountingHoles(Board& board)
{
    const std::vector<Vec2> positions = {{3, 3}, {47, 3}, {3, 27}, {47, 27}};
    int index = 1;
    for (const Vec2& position : positions) {
        auto footprint = std::make_unique<Footprint>("H" + std::to_string(index++), "MountingHole_3.2mm", position);
        auto hole = std::make_unique<Pad>("", PadType::kNpThruHole, PadShape::kCircle, Vec2(0, 0), Vec2(3.2, 3.2), std::vector<std::string> {"*.Cu", "*.Mask"});
        hole->drill = PadDrill {false, 3.2};
        footprint->Add(std::move(hole));
        footprint->Add(std::make_unique<GraphicCircle>(Vec2(0, 0), Vec2(3.45, 0), "F.CrtYd", Stroke {0.05}));
        board.Add(std::move(footprint));
    }
}

void AddTestPoint(Board& board)
{
    auto footprint = std::make_unique<Footprint>("TP1", "TestPoint_Pad", Vec2(40, 22), 0.0, "B.Cu");

    auto pad = std::make_unique<Pad>("1", PadType::kSmd, PadShape::kCustom, Vec2(0, 0), Vec2(1.0, 1.0), std::vector<std::string> {"B.Cu", "B.Mask"}, kNetClk, "/MCU/CLK");
    pad->custom_anchor = PadShape::kCircle;
    pad->AddPrimitive(std::make_unique<GraphicPoly>(std::vector<Vec2> {{0, -1.2}, {0.6, 0}, {0, 1.2}, {-0.6, 0}}, "B.Cu", Stroke {0.1}, true));
    footprint->Add(std::move(pad));

    auto& reference = footprint->Add(std::make_unique<GraphicText>("TP1", Vec2(0, -2), "B.SilkS"));
    reference.options.mirror = true;

    board.Add(std::move(footprint));
}

void AddRouting(Board& board)
{
    // VCC from J1 pin 1 to U1 pin 4 and R1 pad 2
    board.Add(std::make_unique<TraceSegment>(Vec2(6, 12), Vec2(12, 12), 0.4, "F.Cu", kNetVcc));
    board.Add(std::make_unique<TraceArc>(Vec2(12, 12), Vec2(14.5, 13.04), Vec2(15.5, 15.5), 0.4, "F.Cu", kNetVcc));
    board.Add(std::make_unique<TraceSegment>(Vec2(15.5, 15.5), Vec2(17.525, 15.5), 0.4, "F.Cu", kNetVcc));
    board.Add(std::make_unique<TraceSegment>(Vec2(22.475, 15.5), Vec2(30, 15.5), 0.4, "F.Cu", kNetVcc));
    board.Add(std::make_unique<Via>(Vec2(30, 15.5), 0.8, 0.4, "F.Cu", "B.Cu", kNetVcc));
    board.Add(std::make_unique<TraceSegment>(Vec2(30, 15.5), Vec2(34, 15.5), 0.4, "B.Cu", kNetVcc));
    board.Add(std::make_unique<Via>(Vec2(34, 15.5), 0.8, 0.4, "F.Cu", "B.Cu", kNetVcc));
    board.Add(std::make_unique<TraceSegment>(Vec2(34, 15.5), Vec2(34, 12.9), 0.4, "F.Cu", kNetVcc));

    // CLK on an inner layer through blind and micro vias
    board.Add(std::make_unique<TraceSegment>(Vec2(17.525, 11.365), Vec2(15, 11.365), 0.25, "F.Cu", kNetClk));
    board.Add(std::make_unique<Via>(Vec2(15, 11.365), 0.6, 0.3, "F.Cu", "In1.Cu", kNetClk, ViaType::kBlind));
    board.Add(std::make_unique<TraceSegment>(Vec2(15, 11.365), Vec2(15, 6), 0.25, "In1.Cu", kNetClk));
    board.Add(std::make_unique<TraceSegment>(Vec2(15, 6), Vec2(34, 6), 0.25, "In1.Cu", kNetClk));
    board.Add(std::make_unique<Via>(Vec2(34, 6), 0.45, 0.2, "In1.Cu", "In2.Cu", kNetClk, ViaType::kMicro));
    board.Add(std::make_unique<TraceSegment>(Vec2(34, 6), Vec2(40, 6), 0.25, "In2.Cu", kNetClk));
    board.Add(std::make_unique<Via>(Vec2(40, 6), 0.6, 0.3, "In2.Cu", "B.Cu", kNetClk, ViaType::kBlind));
    board.Add(std::make_unique<TraceSegment>(Vec2(40, 6), Vec2(40, 22), 0.25, "B.Cu", kNetClk));

    // GND
    board.Add(std::make_unique<TraceSegment>(Vec2(17.525, 10.095), Vec2(17.525, 8), 0.4, "F.Cu", kNetGnd));
    board.Add(std::make_unique<Via>(Vec2(17.525, 8), 0.8, 0.4, "F.Cu", "B.Cu", kNetGnd));
}

void AddZones(Board& board)
{
    auto ground = std::make_unique<Zone>(std::vector<std::string> {"In2.Cu"}, kNetGnd, "GND");
    ground->filled_polygons.push_back({"In2.Cu", {{1, 1}, {49, 1}, {49, 4.5}, {1, 4.5}}});
    ground->filled_polygons.push_back({"In2.Cu", {{1, 7.5}, {49, 7.5}, {49, 29}, {1, 29}}});
    board.Add(std::move(ground));

    auto pour = std::make_unique<Zone>(std::vector<std::string> {"F&B.Cu"}, kNetGnd, "GND");
    pour->filled_polygons.push_back({"F.Cu", {{42, 24}, {48, 24}, {48, 28.5}, {42, 28.5}}});
    pour->filled_polygons.push_back({"B.Cu", {{2, 20}, {12, 20}, {12, 28.5}, {2, 28.5}}});
    board.Add(std::move(pour));
}

void AddDrawings(Board& board)
{
    board.Add(std::make_unique<GraphicRect>(Vec2(0, 0), Vec2(50, 30), "Edge.Cuts", Stroke {0.1}));
    board.Add(std::make_unique<GraphicArc>(Vec2(46, 30), Vec2(48.83, 28.83), Vec2(50, 26), "Dwgs.User", Stroke {0.15, StrokeType::kDot}));
    board.Add(std::make_unique<GraphicLine>(Vec2(0, -2), Vec2(50, -2), "Dwgs.User", Stroke {0.15, StrokeType::kDashDot}));
    board.Add(std::make_unique<GraphicLine>(Vec2(0, 32), Vec2(50, 32), "Dwgs.User", Stroke {0.15, StrokeType::kDashDotDot}));

    auto& title = board.Add(std::make_unique<GraphicText>("KiViewer sample", Vec2(25, 1.8), "F.SilkS"));
    title.options.size = {1.5, 1.5};
    title.options.thickness = 0.3;
}
}  // namespace

std::shared_ptr<Board> CreateSampleBoard()
{
    auto board = std::make_shared<Board>();
    board->board_name = "sample";

    AddLayers(*board);
    AddNets(*board);
    AddDrawings(*board);
    AddZones(*board);
    AddRouting(*board);
    AddSoic(*board);
    AddConnector(*board);
    AddResistor(*board);
    AddMountingHoles(*board);
    AddTestPoint(*board);

    return board;
}
