#include "test_common.h"

using namespace rxcp;
using rxcp_test::scratch_directory;

namespace
{
    template<typename TResult>
    TResult expect_result(work_executor& executor, const work_request& request)
    {
        work_response response = executor.execute(request);
        ASSERT(response.error_code == 0, "{} failed: {}", work_name(request), response.error_message);
        TResult* const result = std::get_if<TResult>(&response.result);
        ASSERT(result != nullptr, "{} returned an unexpected result", work_name(request));
        return std::move(*result);
    }

    void expect_failure(work_executor& executor, const work_request& request, const int expected_error)
    {
        const work_response response = executor.execute(request);
        ASSERT(response.error_code == expected_error, "{} returns errno {}, expects {}",
               work_name(request), response.error_code, expected_error);
        ASSERT(!response.error_message.empty());
    }

}  // namespace


static void test_stat()
{
    scratch_directory scratch("executor-stat");
    work_executor executor;

    const std::string file = scratch.path("data.bin");
    rxcp_test::write_file(file, rxcp_test::make_content(12345, 1));

    const file_metadata missing = expect_result<file_metadata>(executor, work_stat { scratch.path("missing.bin") });
    ASSERT(!missing.exists);
    ASSERT(missing.file_name == "missing.bin");

    const file_metadata regular = expect_result<file_metadata>(executor, work_stat { file });
    ASSERT(regular.exists);
    ASSERT(!regular.is_directory);
    ASSERT(regular.length == 12345);
    ASSERT(regular.full_path == file);
    ASSERT(regular.parent_path == scratch.root());
    ASSERT(regular.file_name == "data.bin");

    const file_metadata directory = expect_result<file_metadata>(executor, work_stat { scratch.root() });
    ASSERT(directory.exists);
    ASSERT(directory.is_directory);
}

static void test_write_then_read()
{
    scratch_directory scratch("executor-rw");
    work_executor executor;

    const std::string file = scratch.path("out.bin");
    const std::string content = rxcp_test::make_content(10000, 2);

    // Handles are numbered from 1 and never reused
    const uint64_t write_handle = expect_result<handle_result>(executor, work_open_write { file, false }).handle;
    ASSERT(write_handle == 1);
    (void)expect_result<empty_result>(executor, work_append_sub_chunk { write_handle, base64_encode(content.data(), 6000) });
    (void)expect_result<empty_result>(executor, work_close { write_handle });

    const uint64_t append_handle = expect_result<handle_result>(executor, work_open_write { file, true }).handle;
    ASSERT(append_handle == 2);
    (void)expect_result<empty_result>(executor, work_append_sub_chunk { append_handle, base64_encode(content.data() + 6000, 4000) });
    (void)expect_result<empty_result>(executor, work_close { append_handle });
    ASSERT(executor.open_handle_count() == 0);
    ASSERT(rxcp_test::read_file(file) == content);

    const uint64_t read_handle = expect_result<handle_result>(executor, work_open_read { file }).handle;
    ASSERT(read_handle == 3);

    std::string read_back;
    while (true) {
        const sub_chunk_result sub_chunk = expect_result<sub_chunk_result>(executor, work_read_sub_chunk { read_handle, 3000 });
        if (sub_chunk.raw_length == 0) {
            ASSERT(sub_chunk.encoded.empty());
            break;
        }
        ASSERT(sub_chunk.raw_length <= 3000);
        const std::string raw = base64_decode(sub_chunk.encoded);
        ASSERT(raw.size() == sub_chunk.raw_length);
        read_back += raw;
    }
    (void)expect_result<empty_result>(executor, work_close { read_handle });
    ASSERT(read_back == content);
}

static void test_invalid_requests()
{
    scratch_directory scratch("executor-invalid");
    work_executor executor;

    expect_failure(executor, work_close { 42 }, EBADF);
    expect_failure(executor, work_read_sub_chunk { 42, 16 }, EBADF);
    expect_failure(executor, work_open_read { scratch.path("missing.bin") }, ENOENT);
    expect_failure(executor, work_delete_file { scratch.path("missing.bin") }, ENOENT);
    expect_failure(executor, work_digest_file { scratch.path("missing.bin") }, ENOENT);
    expect_failure(executor, work_open_write { scratch.path("no/such/dir/out.bin"), false }, ENOENT);

    const std::string file = scratch.path("data.bin");
    rxcp_test::write_file(file, "payload");
    const uint64_t read_handle = expect_result<handle_result>(executor, work_open_read { file }).handle;
    expect_failure(executor, work_read_sub_chunk { read_handle, MAX_SUB_CHUNK_READ + 1 }, EINVAL);

    const uint64_t write_handle = expect_result<handle_result>(executor, work_open_write { scratch.path("out.bin"), false }).handle;
    expect_failure(executor, work_append_sub_chunk { write_handle, "not base64!" }, EINVAL);

    // A failed unit of work leaves the table alone
    ASSERT(executor.open_handle_count() == 2);
    (void)expect_result<empty_result>(executor, work_close { read_handle });
    (void)expect_result<empty_result>(executor, work_close { write_handle });
    expect_failure(executor, work_close { write_handle }, EBADF);
}

static void test_dispose_closes_leftover_handles()
{
    scratch_directory scratch("executor-dispose");
    const std::string file = scratch.path("data.bin");
    rxcp_test::write_file(file, "leftover");

    work_executor executor;
    (void)expect_result<handle_result>(executor, work_open_read { file });
    (void)expect_result<handle_result>(executor, work_open_write { scratch.path("out.bin"), false });
    ASSERT(executor.open_handle_count() == 2);

    executor.dispose();
    ASSERT(executor.open_handle_count() == 0);
}

static void test_directory_space_digest_copy()
{
    scratch_directory scratch("executor-misc");
    work_executor executor;

    const std::string nested = scratch.path("a/b/c");
    (void)expect_result<empty_result>(executor, work_create_directory { nested });
    ASSERT(stdfs::is_directory(nested));
    (void)expect_result<empty_result>(executor, work_create_directory { nested });

    const free_space_result space = expect_result<free_space_result>(executor, work_query_free_space { nested });
    ASSERT(space.available > 0);

    const std::string file = scratch.path("abc.txt");
    rxcp_test::write_file(file, "abc");
    const digest_result digest = expect_result<digest_result>(executor, work_digest_file { file });
    ASSERT(digest.hex == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    const std::string copy = scratch.path("a/copy.txt");
    (void)expect_result<empty_result>(executor, work_copy_local { file, copy, false });
    ASSERT(rxcp_test::read_file(copy) == "abc");

    rxcp_test::write_file(file, "abcd");
    expect_failure(executor, work_copy_local { file, copy, false }, EEXIST);
    ASSERT(rxcp_test::read_file(copy) == "abc");
    (void)expect_result<empty_result>(executor, work_copy_local { file, copy, true });
    ASSERT(rxcp_test::read_file(copy) == "abcd");

    (void)expect_result<empty_result>(executor, work_delete_file { copy });
    ASSERT(!rxcp_test::file_exists(copy));
}

int main()
{
    [[maybe_unused]]
    const infra::global_initialize_finalize_t __init_fin;

    test_stat();
    test_write_then_read();
    test_invalid_requests();
    test_dispose_closes_leftover_handles();
    test_directory_space_digest_copy();

    LOG_INFO("test_executor passed");
    return 0;
}
