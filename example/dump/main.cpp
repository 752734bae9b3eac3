#include <unistd.h>

#include <iostream>

#include <boost/asio/posix/stream_descriptor.hpp>

#include <shapeshift/converters/raw.hpp>
#include <shapeshift/debug.hpp>
#include <shapeshift/serializer.hpp>

using namespace shapeshift;

namespace {

/// Prints every MessagePack value arriving on the standard input, one per line.
class dump_t {
    const serializer_t& serializer;
    async_reader_t& reader;
    int status;

public:
    dump_t(const serializer_t& serializer, async_reader_t& reader) :
        serializer(serializer),
        reader(reader),
        status(0)
    {}

    int
    result() const {
        return status;
    }

    void
    next() {
        serializer.async_deserialize<raw_t>(reader,
            std::bind(&dump_t::on_value, this, std::placeholders::_1, std::placeholders::_2));
    }

private:
    void
    on_value(const std::exception_ptr& err, raw_t value) {
        if (err) {
            try {
                std::rethrow_exception(err);
            } catch (const serialization_error& e) {
                if (e.code() == error::end_of_stream && reader.eof() && reader.buffered() == 0) {
                    return;
                }

                std::cerr << "ERROR: " << e.what() << std::endl;
                status = 1;
            }

            return;
        }

        std::cout << to_text(sequence_t(value.bytes), serializer.options()) << std::endl;
        next();
    }
};

} // namespace

int main(int argc, char** argv) {
    const options_t options = options_t::from_command_line(argc, argv);

    loop_t loop;
    boost::asio::posix::stream_descriptor input(loop, ::dup(STDIN_FILENO));

    stream_source<boost::asio::posix::stream_descriptor> source(input);
    async_reader_t reader(source, options.minimum_fetch_size);

    serializer_t serializer(options);

    dump_t dump(serializer, reader);
    dump.next();

    loop.run();
    return dump.result();
}
