#include "geodesy_service.h"
#include "great_circle.h"
#include "logging.h"
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

namespace
{
    const char *CSV_HEADER = "timestamp_ms,rpc,code,input,result";

    double ToRadians(double deg) { return deg * M_PI / 180.0; }
    double ToDegrees(double rad) { return rad * 180.0 / M_PI; }

    bool IsFinite(const common::GeoPoint &p)
    {
        return std::isfinite(p.lat()) && std::isfinite(p.lon()) && std::isfinite(p.alt());
    }

    great_circle::GeographicPoint ToGeographic(const common::GeoPoint &p)
    {
        great_circle::GeographicPoint g;
        g.latitude = ToRadians(p.lat());
        g.longitude = ToRadians(p.lon());
        g.height = p.alt();
        return g;
    }

    // Wrap to (-pi, pi]
    double WrapLongitude(double lon)
    {
        double wrapped = great_circle::ZeroToTwoPi(lon + M_PI) - M_PI;
        return (wrapped <= -M_PI) ? M_PI : wrapped;
    }

    grpc::Status CheckPoint(bool present, const common::GeoPoint &p, const char *name)
    {
        if (!present)
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, std::string("missing ") + name);
        if (!IsFinite(p))
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, std::string(name) + " is not finite");
        return grpc::Status::OK;
    }

    std::string FormatPoint(const common::GeoPoint &p)
    {
        std::ostringstream oss;
        oss.precision(9);
        oss << p.lat() << " " << p.lon();
        return oss.str();
    }

    const char *CodeName(grpc::StatusCode code)
    {
        switch (code)
        {
        case grpc::StatusCode::OK:
            return "OK";
        case grpc::StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        default:
            return "ERROR";
        }
    }
}

GeodesyServiceImpl::GeodesyServiceImpl(double default_radius_m, std::string csv_log_path)
    : default_radius_m_(default_radius_m), csv_log_path_(std::move(csv_log_path))
{
}

grpc::Status GeodesyServiceImpl::ResolveRadius(bool has_radius, double radius_m, double *out) const
{
    if (!has_radius)
    {
        *out = default_radius_m_;
        return grpc::Status::OK;
    }
    if (!std::isfinite(radius_m) || radius_m <= 0.0)
    {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "radius_m must be finite and positive");
    }
    *out = radius_m;
    return grpc::Status::OK;
}

void GeodesyServiceImpl::LogRequest(const std::string &rpc, const grpc::Status &status,
                                    const std::string &input, const std::string &result)
{
    if (csv_log_path_.empty())
        return;

    auto now = std::chrono::system_clock::now().time_since_epoch();
    std::ostringstream oss;
    oss << std::chrono::duration_cast<std::chrono::milliseconds>(now).count() << ","
        << rpc << "," << CodeName(status.error_code()) << ","
        << input << "," << (status.ok() ? result : status.error_message());

    // A broken log file never fails the RPC
    if (!utils::LogToCSV(csv_log_path_, CSV_HEADER, oss.str(), csv_mtx_))
        std::cerr << "[GEODESY] " << rpc << " request not logged" << std::endl;
}

grpc::Status GeodesyServiceImpl::GroundDistance(
    grpc::ServerContext *context,
    const geodesy::DistanceRequest *request,
    geodesy::DistanceResponse *response)
{
    std::string input = FormatPoint(request->from()) + " " + FormatPoint(request->to());

    grpc::Status status = CheckPoint(request->has_from(), request->from(), "from");
    if (status.ok())
        status = CheckPoint(request->has_to(), request->to(), "to");

    double radius = 0.0;
    if (status.ok())
        status = ResolveRadius(request->has_radius_m(), request->radius_m(), &radius);

    if (!status.ok())
    {
        std::cerr << "[GEODESY] GroundDistance rejected: " << status.error_message() << std::endl;
        LogRequest("GroundDistance", status, input, "");
        return status;
    }

    double distance = great_circle::GroundDistance(ToGeographic(request->from()),
                                                   ToGeographic(request->to()), radius);
    response->set_distance_m(distance);
    response->set_radius_m(radius);

    std::ostringstream result;
    result.precision(12);
    result << distance;
    LogRequest("GroundDistance", status, input, result.str());
    return grpc::Status::OK;
}

grpc::Status GeodesyServiceImpl::InitialBearing(
    grpc::ServerContext *context,
    const geodesy::BearingRequest *request,
    geodesy::BearingResponse *response)
{
    std::string input = FormatPoint(request->from()) + " " + FormatPoint(request->to());

    grpc::Status status = CheckPoint(request->has_from(), request->from(), "from");
    if (status.ok())
        status = CheckPoint(request->has_to(), request->to(), "to");

    if (!status.ok())
    {
        std::cerr << "[GEODESY] InitialBearing rejected: " << status.error_message() << std::endl;
        LogRequest("InitialBearing", status, input, "");
        return status;
    }

    double bearing = great_circle::InitialBearing(ToGeographic(request->from()),
                                                  ToGeographic(request->to()));
    double bearing_deg = ToDegrees(bearing);
    // Radians just below 2pi can round up to exactly 360 degrees
    if (bearing_deg >= 360.0)
        bearing_deg = 0.0;
    response->set_bearing_deg(bearing_deg);

    std::ostringstream result;
    result.precision(12);
    result << bearing_deg;
    LogRequest("InitialBearing", status, input, result.str());
    return grpc::Status::OK;
}

grpc::Status GeodesyServiceImpl::Destination(
    grpc::ServerContext *context,
    const geodesy::DestinationRequest *request,
    geodesy::DestinationResponse *response)
{
    std::ostringstream input;
    input.precision(12);
    input << FormatPoint(request->origin()) << " " << request->distance_m() << " "
          << request->bearing_deg();

    grpc::Status status = CheckPoint(request->has_origin(), request->origin(), "origin");
    if (status.ok() && (!std::isfinite(request->distance_m()) || !std::isfinite(request->bearing_deg())))
        status = grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                              "distance_m and bearing_deg must be finite");

    double radius = 0.0;
    if (status.ok())
        status = ResolveRadius(request->has_radius_m(), request->radius_m(), &radius);

    if (!status.ok())
    {
        std::cerr << "[GEODESY] Destination rejected: " << status.error_message() << std::endl;
        LogRequest("Destination", status, input.str(), "");
        return status;
    }

    great_circle::GeographicPoint target = great_circle::Destination(
        ToGeographic(request->origin()), request->distance_m(), ToRadians(request->bearing_deg()), radius);

    double lon = request->normalize_lon() ? WrapLongitude(target.longitude) : target.longitude;

    common::GeoPoint *position = response->mutable_position();
    position->set_lat(ToDegrees(target.latitude));
    position->set_lon(ToDegrees(lon));
    position->set_alt(target.height);
    response->set_radius_m(radius);

    LogRequest("Destination", status, input.str(), FormatPoint(*position));
    return grpc::Status::OK;
}
