/**
 * @file kernel_driver.h
 * @brief 解释器侧驱动脚本
 *
 * 由 InterpreterWorker 以 `python3 -u -c <script>` 启动。
 *
 * 协议（两个方向都是 4 字节本机序长度 + UTF-8 JSON）：
 * - 请求从 fd 0 读入：{"id": n, "code": "..."} 或 {"op": "shutdown"}
 * - 应答写到 fd 3：{"id": n, "execution_count": k, "outputs": [...], "error": {...} | null}
 *
 * outputs 使用 nbformat 4 的输出格式。启动后 fd 0 被替换为 /dev/null，
 * 学生代码（以及它启动的子进程）读不到协议流。
 */

#ifndef NBGRADE_SANDBOX_KERNEL_DRIVER_H
#define NBGRADE_SANDBOX_KERNEL_DRIVER_H

namespace nbgrade {
namespace sandbox {

inline const char* kernel_driver_source() {
    return R"PY(
import ast, base64, contextlib, io, json, os, struct, sys, traceback

_in_fd = os.dup(0)
_null = os.open(os.devnull, os.O_RDONLY)
os.dup2(_null, 0)
os.close(_null)
os.set_inheritable(3, False)
_IN = os.fdopen(_in_fd, "rb", buffering=0)
_OUT = os.fdopen(3, "wb", buffering=0)
sys.stdin = io.StringIO("")
os.environ.setdefault("MPLBACKEND", "Agg")
if os.getcwd() not in sys.path:
    sys.path.insert(0, os.getcwd())

_sink = []


def _read_exact(n):
    buf = b""
    while len(buf) < n:
        chunk = _IN.read(n - len(buf))
        if not chunk:
            return None
        buf += chunk
    return buf


def _send(obj):
    data = json.dumps(obj, default=repr).encode("utf-8")
    _OUT.write(struct.pack("=I", len(data)) + data)


class _Capture(io.TextIOBase):
    def __init__(self, stream_name):
        super().__init__()
        self._stream_name = stream_name

    def writable(self):
        return True

    def write(self, s):
        if not isinstance(s, str):
            s = str(s)
        last = _sink[-1] if _sink else None
        if last is not None and last.get("output_type") == "stream" and last.get("name") == self._stream_name:
            last["text"] += s
        else:
            _sink.append({"output_type": "stream", "name": self._stream_name, "text": s})
        return len(s)

    def flush(self):
        pass


def _mime_bundle(value):
    data = {"text/plain": repr(value)}
    for attr, mime in (("_repr_html_", "text/html"), ("_repr_markdown_", "text/markdown")):
        fn = getattr(value, attr, None)
        if callable(fn):
            try:
                rendered = fn()
            except Exception:
                rendered = None
            if rendered:
                data[mime] = rendered
    return data


def display(*objs, **kwargs):
    for obj in objs:
        _sink.append({"output_type": "display_data", "data": _mime_bundle(obj), "metadata": {}})


def _strip_magics(src):
    lines = src.splitlines()
    if lines and lines[0].lstrip().startswith("%%"):
        return ""
    out = []
    for line in lines:
        body = line.lstrip()
        if body.startswith("%") or body.startswith("!"):
            out.append(line[:len(line) - len(body)] + "pass  # " + body)
        else:
            out.append(line)
    return "\n".join(out)


def _flush_figures():
    plt = sys.modules.get("matplotlib.pyplot")
    if plt is None:
        return
    try:
        for num in plt.get_fignums():
            fig = plt.figure(num)
            buf = io.BytesIO()
            fig.savefig(buf, format="png", bbox_inches="tight")
            _sink.append({
                "output_type": "display_data",
                "data": {
                    "text/plain": "<Figure %d>" % num,
                    "image/png": base64.b64encode(buf.getvalue()).decode("ascii"),
                },
                "metadata": {},
            })
        plt.close("all")
    except Exception as e:
        _sink.append({"output_type": "stream", "name": "stderr", "text": "figure capture failed: %r\n" % (e,)})


_ns = {"__name__": "__main__", "__builtins__": __builtins__, "display": display}


def _run(code, count):
    src = _strip_magics(code)
    try:
        tree = ast.parse(src, filename="<cell>", mode="exec")
        last = None
        if tree.body and isinstance(tree.body[-1], ast.Expr):
            last = ast.Expression(tree.body.pop().value)
        with contextlib.redirect_stdout(_Capture("stdout")), contextlib.redirect_stderr(_Capture("stderr")):
            exec(compile(tree, "<cell>", "exec"), _ns)
            if last is not None:
                value = eval(compile(last, "<cell>", "eval"), _ns)
                if value is not None:
                    _ns["_"] = value
                    _sink.append({
                        "output_type": "execute_result",
                        "execution_count": count,
                        "data": _mime_bundle(value),
                        "metadata": {},
                    })
        return None
    except BaseException as e:
        err = {
            "ename": type(e).__name__,
            "evalue": str(e),
            "traceback": traceback.format_exception(type(e), e, e.__traceback__),
        }
        _sink.append(dict(err, output_type="error"))
        return err


def _main():
    count = 0
    while True:
        header = _read_exact(4)
        if header is None:
            break
        (size,) = struct.unpack("=I", header)
        body = _read_exact(size)
        if body is None:
            break
        req = json.loads(body.decode("utf-8"))
        if req.get("op") == "shutdown":
            break
        count += 1
        del _sink[:]
        err = _run(req.get("code", ""), count)
        _flush_figures()
        _send({"id": req.get("id"), "execution_count": count, "outputs": list(_sink), "error": err})


_main()
)PY";
}

} // namespace sandbox
} // namespace nbgrade

#endif // NBGRADE_SANDBOX_KERNEL_DRIVER_H
