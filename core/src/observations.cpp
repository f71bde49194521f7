#include "gpsmooth/observations.hpp"

#include "gpsmooth/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

GPSMOOTH_NS_BEGIN

namespace
{

// Parse all numeric fields of a line. Returns false if any field is not a number.
bool parse_row(const std::string &line, std::vector<double> &fields)
{
    fields.clear();
    std::string normalized(line);
    std::replace(normalized.begin(), normalized.end(), ',', ' ');
    std::replace(normalized.begin(), normalized.end(), '\t', ' ');

    std::istringstream iss(normalized);
    std::string token;
    while (iss >> token)
    {
        char *end = nullptr;
        const double value = std::strtod(token.c_str(), &end);
        if (end == token.c_str() || *end != '\0')
        {
            return false;
        }
        fields.push_back(value);
    }
    return true;
}

}  // namespace

std::string Observations::repr() const
{
    std::ostringstream oss;
    oss << "Observations: [n=" << size();
    if (!covariate.empty())
    {
        const auto [lo, hi] = std::minmax_element(covariate.begin(), covariate.end());
        oss << ", covariate=[" << *lo << ", " << *hi << "]";
    }
    oss << "]";
    return oss.str();
}

Observations make_observations(std::vector<double> covariate, std::vector<double> response)
{
    std::vector<double> weights(covariate.size(), 1.0);
    return make_observations(std::move(covariate), std::move(response), std::move(weights));
}

Observations
make_observations(std::vector<double> covariate, std::vector<double> response, std::vector<double> weights)
{
    Observations obs;
    obs.covariate = std::move(covariate);
    obs.response = std::move(response);
    obs.weights = std::move(weights);
    return obs;
}

void validate_observations(const Observations &observations)
{
    const std::size_t n = observations.covariate.size();
    if (n == 0)
    {
        throw std::invalid_argument("Observation set is empty");
    }
    if (observations.response.size() != n || observations.weights.size() != n)
    {
        throw std::invalid_argument("Observation columns differ in length: covariate=" + std::to_string(n)
                                    + ", response=" + std::to_string(observations.response.size())
                                    + ", weights=" + std::to_string(observations.weights.size()));
    }
    for (std::size_t i = 0; i < n; i++)
    {
        if (!std::isfinite(observations.covariate[i]) || !std::isfinite(observations.response[i]))
        {
            throw std::invalid_argument("Observation " + std::to_string(i) + " has a non-finite value");
        }
        const double w = observations.weights[i];
        if (!(w > 0.0) || !std::isfinite(w))
        {
            throw DegenerateWeightError(i, w);
        }
    }
}

std::vector<double> distinct_covariates(const Observations &observations)
{
    std::vector<double> values(observations.covariate);
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

Observations load_observations(const std::string &file_path)
{
    std::ifstream input_file(file_path);
    if (!input_file.is_open())
    {
        throw std::runtime_error("Error: File not found: " + file_path);
    }

    Observations obs;
    std::vector<double> fields;
    std::string line;
    std::size_t line_number = 0;
    bool seen_data = false;
    while (std::getline(input_file, line))
    {
        line_number++;
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#')
        {
            continue;
        }
        if (!parse_row(line, fields))
        {
            if (!seen_data)
            {
                // header
                seen_data = true;
                continue;
            }
            throw std::runtime_error("Error: Non-numeric field in " + file_path + " line "
                                     + std::to_string(line_number));
        }
        seen_data = true;
        if (fields.size() != 2 && fields.size() != 3)
        {
            throw std::runtime_error("Error: Expected 2 or 3 columns in " + file_path + " line "
                                     + std::to_string(line_number) + ", got " + std::to_string(fields.size()));
        }
        obs.covariate.push_back(fields[0]);
        obs.response.push_back(fields[1]);
        obs.weights.push_back(fields.size() == 3 ? fields[2] : 1.0);
    }

    if (obs.size() == 0)
    {
        throw std::runtime_error("Error: No observations read from " + file_path);
    }
    return obs;
}

GPSMOOTH_NS_END
