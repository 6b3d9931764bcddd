#pragma once

#include <grpcpp/grpcpp.h>
#include <mutex>
#include <string>

#include "geodesy/geodesy.grpc.pb.h"
#include "common/geo.pb.h"

// Great-circle geodesy over gRPC. Wire angles are degrees; the core works in radians.
class GeodesyServiceImpl final : public geodesy::GeodesyService::Service
{
public:
    // default_radius_m: sphere radius for requests that omit radius_m (must be finite and > 0)
    // csv_log_path: request log, empty disables it
    explicit GeodesyServiceImpl(double default_radius_m, std::string csv_log_path = "");

    grpc::Status GroundDistance(grpc::ServerContext *context, const geodesy::DistanceRequest *request,
                                geodesy::DistanceResponse *response) override;
    grpc::Status InitialBearing(grpc::ServerContext *context, const geodesy::BearingRequest *request,
                                geodesy::BearingResponse *response) override;
    grpc::Status Destination(grpc::ServerContext *context, const geodesy::DestinationRequest *request,
                             geodesy::DestinationResponse *response) override;

    double default_radius() const { return default_radius_m_; }

private:
    double default_radius_m_;
    std::string csv_log_path_;
    std::mutex csv_mtx_;

    grpc::Status ResolveRadius(bool has_radius, double radius_m, double *out) const;
    void LogRequest(const std::string &rpc, const grpc::Status &status,
                    const std::string &input, const std::string &result);
};
