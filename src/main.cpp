#include "config/config.hpp"
#include "qdrant/qdrant_client.hpp"
#include "util/log.hpp"
#include "version.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace qdrest {
namespace {

constexpr std::string_view kDefaultCollection = "my_test";
constexpr std::uint64_t kDemoDimension = 4;
constexpr std::uint64_t kDemoTopK = 2;

void print_usage() {
    std::cout << "usage: qdrest-demo [-q|--qdrant-service-endpoint <url>] [--collection <name>]\n"
              << "\n"
              << "The API key is read from QDRANT_API_KEY.\n";
}

Point city_point(std::uint64_t id, std::vector<float> vector, const char* city) {
    return Point{
        .id = id,
        .vector = std::move(vector),
        .payload = nlohmann::json{{"city", city}},
    };
}

std::vector<Point> demo_points() {
    return {
        city_point(1, {0.05f, 0.61f, 0.76f, 0.74f}, "Berlin"),
        city_point(2, {0.19f, 0.81f, 0.75f, 0.11f}, "London"),
        city_point(3, {0.36f, 0.55f, 0.47f, 0.94f}, "Moscow"),
        city_point(4, {0.18f, 0.01f, 0.85f, 0.80f}, "New York"),
        city_point(5, {0.24f, 0.18f, 0.22f, 0.44f}, "Beijing"),
        city_point(6, {0.35f, 0.08f, 0.11f, 0.44f}, "Mumbai"),
    };
}

void print_point(const Point& point) {
    std::cout << "  id=" << point.id << " vector=" << nlohmann::json(point.vector).dump();
    if (point.payload) {
        std::cout << " payload=" << point.payload->dump();
    }
    std::cout << "\n";
}

int run_demo(const QdrantClient& client, const std::string& collection) {
    try {
        if (client.collection_exists(collection)) {
            std::cout << "Collection `" << collection << "` exists\n";
            client.delete_collection(collection);
            std::cout << "Collection `" << collection << "` deleted\n";
        }

        client.create_collection(collection, kDemoDimension);
        std::cout << "Collection `" << collection << "` created\n";

        client.upsert_points(collection, demo_points());
        std::cout << "The collection size is " << client.collection_info(collection) << "\n";

        const std::vector<float> query{0.2f, 0.1f, 0.9f, 0.7f};
        const auto hits = client.search_points(collection, query, kDemoTopK);
        std::cout << "Search returned " << hits.size() << " points\n";
        int rank = 1;
        for (const auto& hit : hits) {
            std::cout << "  #" << rank++ << " id=" << hit.id << " score=" << hit.score;
            if (hit.payload) {
                std::cout << " payload=" << hit.payload->dump();
            }
            std::cout << "\n";
        }

        const auto points = client.get_points(collection, {1, 2, 3, 4, 5, 6, 7, 8});
        std::cout << "Get " << points.size() << " points\n";
        for (const auto& point : points) {
            print_point(point);
        }

        std::cout << "Get point with id 2\n";
        print_point(client.get_point(collection, 2));

        client.delete_points(collection, {1, 4});
        std::cout << "Deleted points 1 and 4\n";
        std::cout << "The collection size is " << client.collection_info(collection) << "\n";

        const auto names = client.list_collections();
        std::cout << "Collections:";
        for (const auto& name : names) {
            std::cout << ' ' << name;
        }
        std::cout << "\n";
        return 0;
    } catch (const QdrantError& ex) {
        log::error(std::string{"demo failed: "} + ex.what());
        return 2;
    }
}

}  // namespace
}  // namespace qdrest

int main(int argc, char** argv) {
    try {
        auto config = qdrest::Config::load();
        qdrest::log::set_level(config.log_level());
        qdrest::log::info(std::string{"qdrest-demo starting (version "} + qdrest::kVersion + ')');

        std::string collection{qdrest::kDefaultCollection};
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg{argv[i]};
            if (arg == "-h" || arg == "--help") {
                qdrest::print_usage();
                return 0;
            } else if (arg == "-q" || arg == "--qdrant-service-endpoint") {
                if (i + 1 >= argc) {
                    qdrest::log::error(std::string{arg} + " requires a URL argument");
                    return 1;
                }
                config.set_qdrant_url(argv[++i]);
            } else if (arg == "--collection") {
                if (i + 1 >= argc) {
                    qdrest::log::error("--collection requires a value");
                    return 1;
                }
                collection = argv[++i];
            } else {
                qdrest::log::error("unknown argument: " + std::string{arg});
                qdrest::print_usage();
                return 1;
            }
        }

        const auto client = qdrest::QdrantClient::from_config(config);
        qdrest::log::info("using qdrant at " + client.base_url());
        return qdrest::run_demo(client, collection);
    } catch (const std::exception& ex) {
        qdrest::log::error(std::string{"fatal error: "} + ex.what());
        return 1;
    }
}
