// src/index_html.h
#pragma once

static const char INDEX_HTML[] = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>docpdf</title>
<style>
  body { font-family: sans-serif; max-width: 40em; margin: 3em auto; color: #222; }
  form { border: 1px solid #ccc; padding: 1.5em; border-radius: 6px; }
  input[type=text] { width: 100%; margin-bottom: 1em; }
  #status { margin-top: 1em; }
</style>
</head>
<body>
<h1>Document to PDF</h1>
<p>Upload a .doc, .docx, .odt, .xlsx, .pptx or similar file (max 10 MiB).</p>
<form id="f">
  <label>API key (if required)<br><input type="text" id="key" autocomplete="off"></label>
  <input type="file" name="file" id="file" required>
  <button type="submit">Convert</button>
</form>
<div id="status"></div>
<script>
document.getElementById('f').addEventListener('submit', async (ev) => {
  ev.preventDefault();
  const status = document.getElementById('status');
  const input = document.getElementById('file');
  if (!input.files.length) return;
  const body = new FormData();
  body.append('file', input.files[0]);
  const headers = {};
  const key = document.getElementById('key').value;
  if (key) headers['X-Api-Key'] = key;
  status.textContent = 'Converting...';
  const res = await fetch('/convert', { method: 'POST', body, headers });
  if (!res.ok) {
    let msg = res.status + ' ' + res.statusText;
    try { msg = (await res.json()).error || msg; } catch (e) {}
    status.textContent = 'Failed: ' + msg;
    return;
  }
  const blob = await res.blob();
  const cd = res.headers.get('Content-Disposition') || '';
  const m = cd.match(/filename="((?:\\.|[^"\\])*)"/);
  const a = document.createElement('a');
  a.href = URL.createObjectURL(blob);
  a.download = m ? m[1].replace(/\\(.)/g, '$1') : 'output.pdf';
  a.click();
  status.textContent = 'Done.';
});
</script>
</body>
</html>
)HTML";
