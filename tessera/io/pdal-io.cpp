/******************************************************************************
* Copyright (c) 2026, Tessera Contributors
*
* Tessera -- Point cloud catalog tiling
*
* Tessera is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <tessera/io/pdal-io.hpp>

#include <sstream>

#include <pdal/PipelineManager.hpp>
#include <pdal/PointTable.hpp>
#include <pdal/PointView.hpp>
#include <pdal/Reader.hpp>
#include <pdal/StageFactory.hpp>
#include <pdal/io/BufferReader.hpp>

#include <tessera/util/pdal-mutex.hpp>

namespace tessera
{

namespace
{

std::string number(const double d)
{
    std::ostringstream ss;
    ss.precision(17);
    ss << d;
    return ss.str();
}

// Last stage of a parsed pipeline.  Must be called under the PDAL lock.
pdal::Stage& parse(pdal::PipelineManager& pm, const json& pipeline)
{
    std::istringstream iss(pipeline.dump());
    pm.readPipeline(iss);

    if (pdal::Stage* s = pm.getStage()) return *s;
    throw std::runtime_error("Empty pipeline: " + pipeline.dump());
}

// Parses and prepares under the PDAL lock, then executes unlocked.
pdal::PointViewSet execute(const json& pipeline, pdal::PointTable& table)
{
    pdal::PipelineManager pm;

    std::unique_lock<std::mutex> lock(PdalMutex::get());

    pdal::Stage& last = parse(pm, pipeline);
    pm.validateStageOptions();
    last.prepare(table);

    lock.unlock();

    return last.execute(table);
}

// Writes in-memory points through a BufferReader.  Dimensions unknown to PDAL
// and the buffer zones, as "Buffer", are stored as LAS extra bytes.
void writeBatch(const PointBatch& batch, const std::string& path)
{
    pdal::PointTable table;
    const pdal::PointLayoutPtr layout(table.layout());

    pdal::Dimension::IdList ids;
    for (const std::string& name : batch.dims())
    {
        pdal::Dimension::Id id(pdal::Dimension::id(name));
        if (id == pdal::Dimension::Id::Unknown)
        {
            id = layout->assignDim(name, pdal::Dimension::Type::Double);
        }
        else layout->registerDim(id);
        ids.push_back(id);
    }

    const bool buffered(!batch.buffer.empty());
    const pdal::Dimension::Id bufferId(buffered
        ? layout->assignDim("Buffer", pdal::Dimension::Type::Unsigned8)
        : pdal::Dimension::Id::Unknown);

    pdal::PointViewPtr view(new pdal::PointView(table));
    for (std::size_t i(0); i < batch.size(); ++i)
    {
        for (std::size_t d(0); d < ids.size(); ++d)
        {
            view->setField(ids[d], i, batch.get(i, d));
        }
        if (buffered)
        {
            view->setField(bufferId, i, static_cast<uint8_t>(batch.buffer[i]));
        }
    }

    pdal::BufferReader reader;
    reader.addView(view);

    pdal::Options options;
    options.add("filename", path);
    options.add("minor_version", 4);
    options.add("extra_dims", "all");

    std::unique_lock<std::mutex> lock(PdalMutex::get());

    pdal::StageFactory factory;
    pdal::Stage* writer(factory.createStage("writers.las"));
    if (!writer) throw std::runtime_error("Failed to create writers.las");

    writer->setOptions(options);
    writer->setInput(reader);
    writer->prepare(table);

    lock.unlock();

    writer->execute(table);
}

} // unnamed namespace

namespace pdalio
{

json readerStages(const TileList& tiles, const json& extra)
{
    json stages = json::array();
    for (const TileRecord& tile : tiles)
    {
        json stage = extra.is_object() ? extra : json::object();
        stage["filename"] = tile.path;
        stages.push_back(stage);
    }
    return stages;
}

json cropStage(const Geometry& g)
{
    if (g.isCircle())
    {
        return {
            { "type", "filters.crop" },
            { "point", "POINT(" + number(g.x) + " " + number(g.y) + ")" },
            { "distance", g.radius() }
        };
    }

    const Bounds b(g.bounds());
    return {
        { "type", "filters.crop" },
        { "bounds",
            "([" + number(b.xmin()) + ", " + number(b.xmax()) + "], [" +
            number(b.ymin()) + ", " + number(b.ymax()) + "])" }
    };
}

json rangeStage(const Clause& c)
{
    const std::string v(number(c.value));
    std::string limit;

    switch (c.op)
    {
        case Comparison::Less:          limit = "[:" + v + ")";     break;
        case Comparison::LessEqual:     limit = "[:" + v + "]";     break;
        case Comparison::Greater:       limit = "(" + v + ":]";     break;
        case Comparison::GreaterEqual:  limit = "[" + v + ":]";     break;
        case Comparison::Equal:         limit = "[" + v + ":" + v + "]"; break;
        case Comparison::NotEqual:      limit = "![" + v + ":" + v + "]"; break;
    }

    return { { "type", "filters.range" }, { "limits", c.dimension + limit } };
}

json filterPipeline(
    const TileList& tiles,
    const Filter& filter,
    const json& extra)
{
    json pipeline = readerStages(tiles, extra);
    if (tiles.size() > 1) pipeline.push_back({ { "type", "filters.merge" } });

    pipeline.push_back(cropStage(filter.shape));

    // One stage per clause: limits on the same dimension within a single
    // filters.range stage are OR-ed, whereas clauses must all hold.
    for (const Clause& c : filter.clauses) pipeline.push_back(rangeStage(c));

    return pipeline;
}

} // namespace pdalio

PointBatch PdalIo::read(
    const TileList& tiles,
    const Filter& filter,
    const json& extra) const
{
    if (tiles.empty()) return PointBatch();

    pdal::PointTable table;
    const pdal::PointViewSet views(
        execute(pdalio::filterPipeline(tiles, filter, extra), table));

    const pdal::PointLayoutPtr layout(table.layout());

    DimList requested(filter.dims);
    if (requested.empty())
    {
        for (const pdal::Dimension::Id id : layout->dims())
        {
            requested.push_back(layout->dimName(id));
        }
    }

    const DimList dims(selectDims(requested));
    pdal::Dimension::IdList ids;

    for (const std::string& name : dims)
    {
        const pdal::Dimension::Id id(layout->findDim(name));
        if (id == pdal::Dimension::Id::Unknown)
        {
            throw std::runtime_error("No dimension " + name + " in sources");
        }
        ids.push_back(id);
    }

    PointBatch batch(dims);
    std::vector<double> values(ids.size());

    for (const pdal::PointViewPtr& view : views)
    {
        batch.reserve(batch.size() + view->size());
        for (pdal::PointId i(0); i < view->size(); ++i)
        {
            for (std::size_t d(0); d < ids.size(); ++d)
            {
                values[d] = view->getFieldAs<double>(ids[d], i);
            }
            batch.push(values);
        }
    }

    return batch;
}

SourceInfo PdalIo::inspect(const std::string& path) const
{
    const json pipeline = json::array({ { { "filename", path } } });

    pdal::PipelineManager pm;

    std::unique_lock<std::mutex> lock(PdalMutex::get());
    pdal::Reader* reader(dynamic_cast<pdal::Reader*>(&parse(pm, pipeline)));
    lock.unlock();

    if (!reader) throw std::runtime_error("No reader for " + path);

    const pdal::QuickInfo qi(reader->preview());
    if (!qi.valid()) throw std::runtime_error("Failed to inspect " + path);

    SourceInfo info;
    info.points = qi.m_pointCount;
    info.bounds = Bounds(
        qi.m_bounds.minx,
        qi.m_bounds.maxx,
        qi.m_bounds.miny,
        qi.m_bounds.maxy);
    return info;
}

WriteReport PdalIo::write(
    const Cluster& cluster,
    const std::string& path) const
{
    if (cluster.tiles.empty())
    {
        writeBatch(PointBatch(), path);
    }
    else
    {
        json pipeline = pdalio::filterPipeline(
            cluster.tiles,
            cluster.filter(),
            cluster.extra);
        pipeline.push_back({ { "type", "writers.las" }, { "filename", path } });

        pdal::PointTable table;
        execute(pipeline, table);
    }

    WriteReport report;
    report.points = inspect(path).points;
    return report;
}

WriteReport PdalIo::write(
    const PointBatch& batch,
    const std::string& path) const
{
    writeBatch(batch, path);

    WriteReport report;
    report.points = inspect(path).points;
    return report;
}

} // namespace tessera
