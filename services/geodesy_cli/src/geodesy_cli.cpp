#include "geodesy_cli.h"
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace
{
    bool ParseNumber(const std::string &text, double *out)
    {
        try
        {
            size_t consumed = 0;
            double v = std::stod(text, &consumed);
            if (consumed != text.size())
                return false;
            *out = v;
            return true;
        }
        catch (const std::invalid_argument &)
        {
            return false;
        }
        catch (const std::out_of_range &)
        {
            return false;
        }
    }

    int ReportFailure(const grpc::Status &status)
    {
        std::cerr << "[GEODESY-CLI] RPC failed: " << status.error_message() << std::endl;
        return 1;
    }
}

const char *UsageText()
{
    return "usage:\n"
           "  geodesy_cli distance    <lat1> <lon1> <lat2> <lon2> [radius_m]\n"
           "  geodesy_cli bearing     <lat1> <lon1> <lat2> <lon2>\n"
           "  geodesy_cli destination <lat> <lon> <distance_m> <bearing_deg> [radius_m]\n";
}

bool ParseCommand(const std::vector<std::string> &args, CliCommand *cmd, std::string *error)
{
    if (args.empty())
    {
        *error = "missing command";
        return false;
    }

    const std::string &name = args[0];
    size_t min_args = 4;
    size_t max_args = 5;
    if (name == "distance")
        cmd->kind = CliCommand::Kind::Distance;
    else if (name == "bearing")
    {
        cmd->kind = CliCommand::Kind::Bearing;
        max_args = 4;
    }
    else if (name == "destination")
        cmd->kind = CliCommand::Kind::Destination;
    else
    {
        *error = "unknown command: " + name;
        return false;
    }

    size_t count = args.size() - 1;
    if (count < min_args || count > max_args)
    {
        *error = "wrong number of arguments for " + name;
        return false;
    }

    std::vector<double> values(count);
    for (size_t i = 0; i < count; ++i)
    {
        if (!ParseNumber(args[i + 1], &values[i]))
        {
            *error = "not a number: " + args[i + 1];
            return false;
        }
    }

    cmd->lat1 = values[0];
    cmd->lon1 = values[1];
    if (cmd->kind == CliCommand::Kind::Destination)
    {
        cmd->distance_m = values[2];
        cmd->bearing_deg = values[3];
    }
    else
    {
        cmd->lat2 = values[2];
        cmd->lon2 = values[3];
    }

    cmd->has_radius = (count == 5);
    if (cmd->has_radius)
        cmd->radius_m = values[4];
    return true;
}

GeodesyCLI::GeodesyCLI(const std::string &geodesy_addr)
{
    auto channel = grpc::CreateChannel(geodesy_addr, grpc::InsecureChannelCredentials());
    stub_ = geodesy::GeodesyService::NewStub(channel);
}

int GeodesyCLI::Execute(const CliCommand &cmd)
{
    switch (cmd.kind)
    {
    case CliCommand::Kind::Distance:
        return RunDistance(cmd);
    case CliCommand::Kind::Bearing:
        return RunBearing(cmd);
    case CliCommand::Kind::Destination:
        return RunDestination(cmd);
    }
    return 2;
}

void GeodesyCLI::PrintRow(const std::string &label, double value, int precision)
{
    std::cout << std::left << std::setw(16) << label
              << std::fixed << std::setprecision(precision) << value << "\n";
}

int GeodesyCLI::RunDistance(const CliCommand &cmd)
{
    geodesy::DistanceRequest req;
    req.mutable_from()->set_lat(cmd.lat1);
    req.mutable_from()->set_lon(cmd.lon1);
    req.mutable_to()->set_lat(cmd.lat2);
    req.mutable_to()->set_lon(cmd.lon2);
    if (cmd.has_radius)
        req.set_radius_m(cmd.radius_m);

    geodesy::DistanceResponse resp;
    grpc::ClientContext ctx;
    grpc::Status status = stub_->GroundDistance(&ctx, req, &resp);
    if (!status.ok())
        return ReportFailure(status);

    std::cout << "================ GREAT-CIRCLE DISTANCE ================\n";
    PrintRow("DISTANCE(m)", resp.distance_m(), 3);
    PrintRow("RADIUS(m)", resp.radius_m(), 1);
    std::cout << "=======================================================" << std::endl;
    return 0;
}

int GeodesyCLI::RunBearing(const CliCommand &cmd)
{
    geodesy::BearingRequest req;
    req.mutable_from()->set_lat(cmd.lat1);
    req.mutable_from()->set_lon(cmd.lon1);
    req.mutable_to()->set_lat(cmd.lat2);
    req.mutable_to()->set_lon(cmd.lon2);

    geodesy::BearingResponse resp;
    grpc::ClientContext ctx;
    grpc::Status status = stub_->InitialBearing(&ctx, req, &resp);
    if (!status.ok())
        return ReportFailure(status);

    std::cout << "=================== INITIAL BEARING ===================\n";
    PrintRow("BEARING(deg)", resp.bearing_deg(), 6);
    std::cout << "=======================================================" << std::endl;
    return 0;
}

int GeodesyCLI::RunDestination(const CliCommand &cmd)
{
    geodesy::DestinationRequest req;
    req.mutable_origin()->set_lat(cmd.lat1);
    req.mutable_origin()->set_lon(cmd.lon1);
    req.set_distance_m(cmd.distance_m);
    req.set_bearing_deg(cmd.bearing_deg);
    // Human-facing output, so show a canonical longitude
    req.set_normalize_lon(true);
    if (cmd.has_radius)
        req.set_radius_m(cmd.radius_m);

    geodesy::DestinationResponse resp;
    grpc::ClientContext ctx;
    grpc::Status status = stub_->Destination(&ctx, req, &resp);
    if (!status.ok())
        return ReportFailure(status);

    std::cout << "===================== DESTINATION =====================\n";
    PrintRow("LAT(deg)", resp.position().lat(), 6);
    PrintRow("LON(deg)", resp.position().lon(), 6);
    PrintRow("RADIUS(m)", resp.radius_m(), 1);
    std::cout << "=======================================================" << std::endl;
    return 0;
}
