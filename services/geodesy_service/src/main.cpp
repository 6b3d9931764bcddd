#include "geodesy_service.h"
#include "great_circle.h"
#include "config.h"
#include <grpcpp/grpcpp.h>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

int main()
{
    std::string address = utils::GetEnvString("GEODESY_ADDR", "0.0.0.0:6100");
    std::string csv_path = utils::GetEnvString("GEODESY_LOG_CSV", "");

    double radius = utils::GetEnvDouble("GEODESY_RADIUS_M", great_circle::MEAN_EARTH_RADIUS);
    if (!std::isfinite(radius) || radius <= 0.0)
    {
        std::cerr << "[GEODESY] Ignoring GEODESY_RADIUS_M=" << radius
                  << ", using mean Earth radius." << std::endl;
        radius = great_circle::MEAN_EARTH_RADIUS;
    }

    GeodesyServiceImpl service(radius, csv_path);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server)
    {
        std::cerr << "[GEODESY] Failed to start server at " << address << std::endl;
        return 1;
    }

    std::cout << "[GEODESY] Running at " << address << " (radius " << radius << " m)" << std::endl;
    if (!csv_path.empty())
        std::cout << "[GEODESY] Logging requests to " << csv_path << std::endl;

    server->Wait();

    std::cout << "[GEODESY] Server stopped." << std::endl;
    return 0;
}
