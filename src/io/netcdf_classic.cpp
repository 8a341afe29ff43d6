/**
 * @file netcdf_classic.cpp
 * @brief Native NetCDF classic encoder and decoder.
 *
 * All multi-byte values are big-endian. Names, attribute values and
 * variable data are padded to 4-byte boundaries. The writer produces
 * CDF-1 (32-bit offsets); the reader accepts CDF-1 and CDF-2.
 */

#include "netcdf_classic.hpp"
#include "column_contract.hpp"
#include "numeric_utils.hpp"

#include <array>
#include <cstring>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace fmet
{
namespace
{

constexpr std::int32_t kNcDimensionTag = 10;
constexpr std::int32_t kNcVariableTag = 11;
constexpr std::int32_t kNcAttributeTag = 12;

/**
 * @brief Attribute queued for encoding. Text is used for NC_CHAR.
 */
struct OutAttribute
{
    std::string name;
    std::int32_t type = nc_char;
    std::string text;
    std::vector<double> values;
};

struct OutVariable
{
    std::string name;
    std::int32_t type = nc_double;
    std::vector<OutAttribute> attributes;
    std::vector<double> data;
};

OutAttribute text_attribute(const std::string& name, const std::string& text)
{
    OutAttribute attr;
    attr.name = name;
    attr.type = nc_char;
    attr.text = text;
    return attr;
}

OutAttribute double_attribute(const std::string& name, double value)
{
    OutAttribute attr;
    attr.name = name;
    attr.type = nc_double;
    attr.values.push_back(value);
    return attr;
}

std::size_t padding_to_4(std::size_t byte_count)
{
    const std::size_t rem = byte_count % 4;
    return rem == 0 ? 0 : (4 - rem);
}

std::size_t nc_type_size_bytes(std::int32_t type)
{
    switch (type)
    {
        case nc_byte:
        case nc_char:
            return 1;
        case nc_short:
            return 2;
        case nc_int:
        case nc_float:
            return 4;
        case nc_double:
            return 8;
        default:
            throw std::runtime_error("Unsupported NetCDF type id: " + std::to_string(type));
    }
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

void put_be_u32(std::vector<std::uint8_t>& buf, std::uint32_t value)
{
    buf.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    buf.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    buf.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buf.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void put_be_i32(std::vector<std::uint8_t>& buf, std::int32_t value)
{
    put_be_u32(buf, static_cast<std::uint32_t>(value));
}

void put_be_u64(std::vector<std::uint8_t>& buf, std::uint64_t value)
{
    put_be_u32(buf, static_cast<std::uint32_t>(value >> 32));
    put_be_u32(buf, static_cast<std::uint32_t>(value & 0xFFFFFFFFu));
}

void put_be_f64(std::vector<std::uint8_t>& buf, double value)
{
    std::uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    put_be_u64(buf, bits);
}

void put_padding(std::vector<std::uint8_t>& buf, std::size_t byte_count)
{
    buf.insert(buf.end(), padding_to_4(byte_count), std::uint8_t{0});
}

void put_name(std::vector<std::uint8_t>& buf, const std::string& name)
{
    put_be_u32(buf, static_cast<std::uint32_t>(name.size()));
    buf.insert(buf.end(), name.begin(), name.end());
    put_padding(buf, name.size());
}

/**
 * @brief Encodes one scalar of a numeric type.
 */
void put_value(std::vector<std::uint8_t>& buf, std::int32_t type, double value)
{
    switch (type)
    {
        case nc_int:
            put_be_i32(buf, static_cast<std::int32_t>(value));
            break;
        case nc_double:
            put_be_f64(buf, value);
            break;
        default:
            throw std::runtime_error("NetCDF writer does not encode type id " + std::to_string(type));
    }
}

void put_attribute_list(std::vector<std::uint8_t>& buf, const std::vector<OutAttribute>& attrs)
{
    if (attrs.empty())
    {
        put_be_u32(buf, 0);
        put_be_u32(buf, 0);
        return;
    }

    put_be_i32(buf, kNcAttributeTag);
    put_be_u32(buf, static_cast<std::uint32_t>(attrs.size()));
    for (const OutAttribute& attr : attrs)
    {
        put_name(buf, attr.name);
        put_be_i32(buf, attr.type);
        if (attr.type == nc_char)
        {
            put_be_u32(buf, static_cast<std::uint32_t>(attr.text.size()));
            buf.insert(buf.end(), attr.text.begin(), attr.text.end());
            put_padding(buf, attr.text.size());
            continue;
        }
        put_be_u32(buf, static_cast<std::uint32_t>(attr.values.size()));
        for (const double v : attr.values)
        {
            put_value(buf, attr.type, v);
        }
        put_padding(buf, attr.values.size() * nc_type_size_bytes(attr.type));
    }
}

std::uint32_t variable_vsize(const OutVariable& var)
{
    const std::size_t bytes = var.data.size() * nc_type_size_bytes(var.type);
    return static_cast<std::uint32_t>(bytes + padding_to_4(bytes));
}

/**
 * @brief Encodes the complete header for the given variable offsets.
 */
std::vector<std::uint8_t> encode_header(std::size_t row_count,
                                        const std::vector<OutAttribute>& global_attrs,
                                        const std::vector<OutVariable>& vars,
                                        const std::vector<std::uint32_t>& begins)
{
    std::vector<std::uint8_t> buf = {'C', 'D', 'F', 1};
    put_be_u32(buf, 0);

    put_be_i32(buf, kNcDimensionTag);
    put_be_u32(buf, 1);
    put_name(buf, "time");
    put_be_u32(buf, static_cast<std::uint32_t>(row_count));

    put_attribute_list(buf, global_attrs);

    put_be_i32(buf, kNcVariableTag);
    put_be_u32(buf, static_cast<std::uint32_t>(vars.size()));
    for (std::size_t i = 0; i < vars.size(); ++i)
    {
        const OutVariable& var = vars[i];
        put_name(buf, var.name);
        put_be_u32(buf, 1);
        put_be_u32(buf, 0);
        put_attribute_list(buf, var.attributes);
        put_be_i32(buf, var.type);
        put_be_u32(buf, variable_vsize(var));
        put_be_u32(buf, begins[i]);
    }
    return buf;
}

std::vector<OutVariable> build_variables(const ObservationTable& table)
{
    std::vector<OutVariable> vars;

    const ColumnContract* time_contract = find_column_contract("time");
    const ColumnContract* obs_contract = find_column_contract("obs");

    OutVariable time_var;
    time_var.name = time_contract->netcdf_name;
    time_var.type = nc_double;
    time_var.attributes = {
        text_attribute("units", time_contract->units),
        text_attribute("long_name", time_contract->long_name),
        text_attribute("standard_name", time_contract->standard_name),
        text_attribute("calendar", "standard"),
        text_attribute("comment", "Absolute time in UTC"),
    };
    time_var.data = extract_column(table, *time_contract);
    vars.push_back(std::move(time_var));

    OutVariable obs_var;
    obs_var.name = obs_contract->netcdf_name;
    obs_var.type = nc_int;
    obs_var.attributes = {
        text_attribute("long_name", obs_contract->long_name),
        text_attribute("units", obs_contract->units),
    };
    obs_var.data = extract_column(table, *obs_contract);
    vars.push_back(std::move(obs_var));

    for (const ColumnContract* contract : netcdf_data_columns())
    {
        OutVariable var;
        var.name = contract->netcdf_name;
        var.type = nc_double;
        var.attributes.push_back(text_attribute("units", contract->units));
        var.attributes.push_back(text_attribute("long_name", contract->long_name));
        var.attributes.push_back(text_attribute("standard_name", contract->standard_name));
        if (contract->id == "altitude")
        {
            var.attributes.push_back(text_attribute("positive", "up"));
        }
        var.attributes.push_back(double_attribute("_FillValue", numeric::quiet_nan()));
        var.attributes.push_back(text_attribute("coordinates", obs_contract->netcdf_name));
        var.data = extract_column(table, *contract);
        vars.push_back(std::move(var));
    }
    return vars;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

std::uint32_t read_be_u32(std::istream& in, const std::string& context)
{
    std::array<unsigned char, 4> bytes{};
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!in)
    {
        throw std::runtime_error("Unexpected EOF while reading " + context);
    }
    return (static_cast<std::uint32_t>(bytes[0]) << 24) |
           (static_cast<std::uint32_t>(bytes[1]) << 16) |
           (static_cast<std::uint32_t>(bytes[2]) << 8) |
           static_cast<std::uint32_t>(bytes[3]);
}

std::int32_t read_be_i32(std::istream& in, const std::string& context)
{
    return static_cast<std::int32_t>(read_be_u32(in, context));
}

std::uint64_t read_be_u64(std::istream& in, const std::string& context)
{
    const std::uint64_t hi = read_be_u32(in, context);
    const std::uint64_t lo = read_be_u32(in, context);
    return (hi << 32) | lo;
}

void skip_padding(std::istream& in, std::size_t byte_count, const std::string& context)
{
    if (byte_count == 0)
    {
        return;
    }
    in.seekg(static_cast<std::streamoff>(byte_count), std::ios::cur);
    if (!in)
    {
        throw std::runtime_error("Unexpected EOF while skipping padding in " + context);
    }
}

std::string read_netcdf_name(std::istream& in, const std::string& context)
{
    const std::uint32_t length = read_be_u32(in, context + " name length");
    if (length > (1u << 20))
    {
        throw std::runtime_error("NetCDF name too long in " + context);
    }
    std::string value(length, '\0');
    if (length > 0)
    {
        in.read(value.data(), static_cast<std::streamsize>(length));
        if (!in)
        {
            throw std::runtime_error("Unexpected EOF while reading NetCDF name in " + context);
        }
    }
    skip_padding(in, padding_to_4(length), context + " name padding");
    return value;
}

std::map<std::string, NetcdfAttribute> read_netcdf_attribute_list(std::istream& in, const std::string& context)
{
    const std::int32_t tag = read_be_i32(in, context + " tag");
    const std::int32_t count_raw = read_be_i32(in, context + " count");
    if (tag == 0 && count_raw == 0)
    {
        return {};
    }
    if (tag != kNcAttributeTag || count_raw < 0)
    {
        throw std::runtime_error("Malformed NetCDF attribute list in " + context);
    }

    std::map<std::string, NetcdfAttribute> attrs;
    for (std::int32_t i = 0; i < count_raw; ++i)
    {
        const std::string name = read_netcdf_name(in, context + " attribute");
        NetcdfAttribute attr;
        attr.type = read_be_i32(in, context + " attribute type");
        const std::int32_t elements_raw = read_be_i32(in, context + " attribute size");
        if (elements_raw < 0)
        {
            throw std::runtime_error("Negative NetCDF attribute size for '" + name + "'");
        }
        attr.element_count = static_cast<std::size_t>(elements_raw);
        const std::size_t byte_count = attr.element_count * nc_type_size_bytes(attr.type);
        attr.raw.resize(byte_count);
        if (byte_count > 0)
        {
            in.read(reinterpret_cast<char*>(attr.raw.data()), static_cast<std::streamsize>(byte_count));
            if (!in)
            {
                throw std::runtime_error("Unexpected EOF while reading NetCDF attribute '" + name + "'");
            }
        }
        skip_padding(in, padding_to_4(byte_count), context + " attribute padding");
        attrs[name] = std::move(attr);
    }
    return attrs;
}

std::vector<NetcdfDimension> read_netcdf_dimension_list(std::istream& in)
{
    const std::int32_t tag = read_be_i32(in, "dimension list tag");
    const std::int32_t count_raw = read_be_i32(in, "dimension list count");
    if (tag == 0 && count_raw == 0)
    {
        return {};
    }
    if (tag != kNcDimensionTag || count_raw < 0)
    {
        throw std::runtime_error("Malformed NetCDF dimension list");
    }

    std::vector<NetcdfDimension> dims;
    for (std::int32_t i = 0; i < count_raw; ++i)
    {
        NetcdfDimension dim;
        dim.name = read_netcdf_name(in, "dimension");
        const std::int32_t length_raw = read_be_i32(in, "dimension length");
        if (length_raw < 0)
        {
            throw std::runtime_error("Negative NetCDF dimension length for '" + dim.name + "'");
        }
        dim.unlimited = (length_raw == 0);
        dim.length = static_cast<std::uint64_t>(length_raw);
        dims.push_back(std::move(dim));
    }
    return dims;
}

std::vector<NetcdfVariable> read_netcdf_variable_list(std::istream& in, int version)
{
    const std::int32_t tag = read_be_i32(in, "variable list tag");
    const std::int32_t count_raw = read_be_i32(in, "variable list count");
    if (tag == 0 && count_raw == 0)
    {
        return {};
    }
    if (tag != kNcVariableTag || count_raw < 0)
    {
        throw std::runtime_error("Malformed NetCDF variable list");
    }

    std::vector<NetcdfVariable> vars;
    for (std::int32_t i = 0; i < count_raw; ++i)
    {
        NetcdfVariable var;
        var.name = read_netcdf_name(in, "variable");
        const std::int32_t dim_count = read_be_i32(in, "variable dimension count");
        if (dim_count < 0)
        {
            throw std::runtime_error("Negative NetCDF dimension count for variable '" + var.name + "'");
        }
        for (std::int32_t d = 0; d < dim_count; ++d)
        {
            var.dim_ids.push_back(read_be_i32(in, "variable dimension id"));
        }
        var.attributes = read_netcdf_attribute_list(in, "variable '" + var.name + "' attributes");
        var.type = read_be_i32(in, "variable '" + var.name + "' type");
        var.vsize = read_be_u32(in, "variable '" + var.name + "' vsize");
        var.begin = (version == 2)
            ? read_be_u64(in, "variable '" + var.name + "' begin")
            : static_cast<std::uint64_t>(read_be_u32(in, "variable '" + var.name + "' begin"));
        vars.push_back(std::move(var));
    }
    return vars;
}

double decode_be_value(const unsigned char* p, std::int32_t type)
{
    switch (type)
    {
        case nc_byte:
            return static_cast<double>(static_cast<std::int8_t>(p[0]));
        case nc_short:
            return static_cast<double>(static_cast<std::int16_t>(
                (static_cast<std::uint16_t>(p[0]) << 8) | static_cast<std::uint16_t>(p[1])));
        case nc_int:
        case nc_float:
        {
            const std::uint32_t bits = (static_cast<std::uint32_t>(p[0]) << 24) |
                                       (static_cast<std::uint32_t>(p[1]) << 16) |
                                       (static_cast<std::uint32_t>(p[2]) << 8) |
                                       static_cast<std::uint32_t>(p[3]);
            if (type == nc_int)
            {
                return static_cast<double>(static_cast<std::int32_t>(bits));
            }
            float value = 0.0f;
            std::memcpy(&value, &bits, sizeof(value));
            return static_cast<double>(value);
        }
        case nc_double:
        {
            std::uint64_t bits = 0;
            for (int i = 0; i < 8; ++i)
            {
                bits = (bits << 8) | static_cast<std::uint64_t>(p[i]);
            }
            double value = 0.0;
            std::memcpy(&value, &bits, sizeof(value));
            return value;
        }
        default:
            throw std::runtime_error("Unsupported NetCDF numeric type id: " + std::to_string(type));
    }
}

} // namespace

const NetcdfVariable* NetcdfClassicHeader::find_variable(const std::string& name) const
{
    for (const NetcdfVariable& var : variables)
    {
        if (var.name == name)
        {
            return &var;
        }
    }
    return nullptr;
}

void write_netcdf_classic(const ObservationTable& table,
                          const std::filesystem::path& path,
                          const NetcdfWriteOptions& options)
{
    if (table.empty())
    {
        throw std::runtime_error("Refusing to write NetCDF file with zero observations");
    }
    if (table.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()))
    {
        throw std::runtime_error("Observation count exceeds NetCDF classic dimension limit");
    }

    std::vector<OutAttribute> global_attrs = {
        text_attribute("Conventions", "CF-1.8"),
        text_attribute("title", options.title),
    };
    if (!options.source.empty())
    {
        global_attrs.push_back(text_attribute("source", options.source));
    }
    if (!options.history.empty())
    {
        global_attrs.push_back(text_attribute("history", options.history));
    }

    const std::vector<OutVariable> vars = build_variables(table);

    std::vector<std::uint32_t> begins(vars.size(), 0);
    const std::size_t header_size = encode_header(table.size(), global_attrs, vars, begins).size();

    std::uint64_t offset = header_size;
    for (std::size_t i = 0; i < vars.size(); ++i)
    {
        if (offset > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::runtime_error("NetCDF classic 32-bit offset limit exceeded");
        }
        begins[i] = static_cast<std::uint32_t>(offset);
        offset += variable_vsize(vars[i]);
    }

    std::vector<std::uint8_t> bytes = encode_header(table.size(), global_attrs, vars, begins);
    bytes.reserve(static_cast<std::size_t>(offset));
    for (const OutVariable& var : vars)
    {
        for (const double v : var.data)
        {
            put_value(bytes, var.type, v);
        }
        put_padding(bytes, var.data.size() * nc_type_size_bytes(var.type));
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error("Failed to open NetCDF output for writing: " + path.string());
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        throw std::runtime_error("Failed to write NetCDF output: " + path.string());
    }
}

NetcdfClassicHeader read_netcdf_classic_header(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        throw std::runtime_error("Failed to open NetCDF file: " + path.string());
    }

    std::array<char, 4> magic{};
    in.read(magic.data(), static_cast<std::streamsize>(magic.size()));
    if (!in)
    {
        throw std::runtime_error("Failed to read NetCDF signature from: " + path.string());
    }
    if (magic[0] != 'C' || magic[1] != 'D' || magic[2] != 'F')
    {
        throw std::runtime_error("Not a NetCDF classic file (invalid CDF signature)");
    }

    const int version = static_cast<unsigned char>(magic[3]);
    if (version != 1 && version != 2)
    {
        throw std::runtime_error("Only NetCDF classic and 64-bit offset formats are supported");
    }

    NetcdfClassicHeader header;
    header.version = version;
    header.num_records = read_be_u32(in, "numrecs");
    header.dimensions = read_netcdf_dimension_list(in);
    header.global_attributes = read_netcdf_attribute_list(in, "global attributes");
    header.variables = read_netcdf_variable_list(in, version);

    for (const NetcdfVariable& var : header.variables)
    {
        for (const std::int32_t dim_id : var.dim_ids)
        {
            if (dim_id < 0 || static_cast<std::size_t>(dim_id) >= header.dimensions.size())
            {
                throw std::runtime_error("NetCDF variable '" + var.name + "' references invalid dimension id");
            }
        }
    }
    return header;
}

std::vector<double> read_netcdf_variable(const std::filesystem::path& path,
                                         const NetcdfClassicHeader& header,
                                         const NetcdfVariable& variable)
{
    std::size_t count = 1;
    for (const std::int32_t dim_id : variable.dim_ids)
    {
        const NetcdfDimension& dim = header.dimensions[static_cast<std::size_t>(dim_id)];
        if (dim.unlimited)
        {
            throw std::runtime_error("Record variables are not supported: '" + variable.name + "'");
        }
        count *= static_cast<std::size_t>(dim.length);
    }

    const std::size_t width = nc_type_size_bytes(variable.type);
    if (variable.type == nc_char)
    {
        throw std::runtime_error("Variable '" + variable.name + "' is not numeric");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        throw std::runtime_error("Failed to open NetCDF file: " + path.string());
    }
    in.seekg(static_cast<std::streamoff>(variable.begin));

    std::vector<unsigned char> raw(count * width);
    if (!raw.empty())
    {
        in.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
        if (!in)
        {
            throw std::runtime_error("Unexpected EOF while reading NetCDF variable '" + variable.name + "'");
        }
    }

    std::vector<double> values(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        values[i] = decode_be_value(raw.data() + i * width, variable.type);
    }
    return values;
}

ObservationTable read_netcdf_observation_table(const std::filesystem::path& path)
{
    const NetcdfClassicHeader header = read_netcdf_classic_header(path);

    const ColumnContract* time_contract = find_column_contract("time");
    const NetcdfVariable* time_var = header.find_variable(time_contract->netcdf_name);
    if (!time_var)
    {
        throw std::runtime_error("NetCDF file has no '" + time_contract->netcdf_name + "' variable");
    }

    const std::vector<double> time = read_netcdf_variable(path, header, *time_var);
    ObservationTable table;
    table.rows.resize(time.size());
    for (std::size_t i = 0; i < time.size(); ++i)
    {
        set_column_value(table.rows[i], *time_contract, time[i]);
        table.rows[i].obs = static_cast<int>(i + 1);
    }

    for (const auto& contract : observation_column_contracts())
    {
        if (contract.netcdf_name.empty() || &contract == time_contract)
        {
            continue;
        }
        const NetcdfVariable* var = header.find_variable(contract.netcdf_name);
        if (!var)
        {
            continue;
        }
        const std::vector<double> values = read_netcdf_variable(path, header, *var);
        if (values.size() != table.rows.size())
        {
            throw std::runtime_error("NetCDF variable '" + var->name + "' does not match the time dimension");
        }
        for (std::size_t i = 0; i < values.size(); ++i)
        {
            set_column_value(table.rows[i], contract, values[i]);
        }
    }
    return table;
}

std::string netcdf_attribute_text(const NetcdfAttribute& attribute)
{
    if (attribute.type != nc_char)
    {
        return {};
    }
    return std::string(attribute.raw.begin(), attribute.raw.end());
}

std::vector<double> netcdf_attribute_values(const NetcdfAttribute& attribute)
{
    if (attribute.type == nc_char)
    {
        return {};
    }
    const std::size_t width = nc_type_size_bytes(attribute.type);
    std::vector<double> values;
    values.reserve(attribute.element_count);
    for (std::size_t i = 0; i < attribute.element_count; ++i)
    {
        values.push_back(decode_be_value(attribute.raw.data() + i * width, attribute.type));
    }
    return values;
}

} // namespace fmet
