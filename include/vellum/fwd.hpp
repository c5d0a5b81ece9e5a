#pragma once

namespace vellum
{

struct Point;
struct Rect;
struct Tick;
struct LayoutConfig;
struct SvgOptions;

class Scale;
class Domain;
class BoundDomain;
class Axis;
class Title;
class Plot;
class Chart;
class ChartBuilder;
class Page;
class Logger;

}   // namespace vellum
