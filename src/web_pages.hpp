#pragma once

namespace logtap {

inline constexpr const char* kIndexHtml = R"HTML(<!doctype html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>logtap</title>
<style>
  body { font-family: system-ui, sans-serif; margin: 1rem; }
  .bar { display: flex; gap: .75rem; align-items: flex-end; flex-wrap: wrap; }
  #log { height: 75vh; overflow: auto; border: 1px solid #ddd; border-radius: 4px; padding: .5rem; margin-top: .75rem; }
  .line { font: 12px ui-monospace, Menlo, Consolas, monospace; white-space: pre-wrap; }
  .ERROR { color: #b00020; } .WARNING { color: #9a6700; } .DEBUG { color: #777; }
  #status { color: #777; font-size: 12px; }
</style>
</head>
<body>
<div class="bar">
  <label>Files<br><select id="files" multiple size="4"></select></label>
  <label style="flex-grow:1">Filter (key=value, comma separated)<br>
    <input id="filter" style="width:100%" placeholder="level=ERROR,component=mcp-server"></label>
  <label><input id="follow" type="checkbox" checked> Follow</label>
  <button id="apply">Apply</button>
  <a href="/dashboard">Dashboard</a>
</div>
<div id="status"></div>
<div id="log"></div>
<script>
let es;
const status = (t) => document.getElementById('status').textContent = t;

function append(panel, follow, data) {
  const div = document.createElement('div');
  div.className = 'line';
  try { div.classList.add(String(JSON.parse(data).level || '').toUpperCase()); } catch (e) {}
  div.textContent = data;
  panel.appendChild(div);
  if (follow.checked) panel.scrollTop = panel.scrollHeight;
}

async function loadFiles() {
  const files = await (await fetch('/files')).json();
  const select = document.getElementById('files');
  select.innerHTML = '';
  files.forEach(f => select.add(new Option(f, f)));
}

async function start() {
  if (es) es.close();
  const params = new URLSearchParams();
  const selected = Array.from(document.getElementById('files').selectedOptions).map(o => o.value);
  if (selected.length) params.set('files', selected.join(','));
  const filter = document.getElementById('filter').value.trim();
  if (filter) params.set('filter', filter);
  const url = '/stream?' + params.toString();

  const log = document.getElementById('log');
  log.innerHTML = '';
  status('streaming ' + (selected.length ? selected.join(', ') : 'all files'));
  es = new EventSource(url);
  es.onmessage = (ev) => append(log, document.getElementById('follow'), ev.data);
  es.onerror = async () => {
    if (es.readyState !== EventSource.CLOSED) { status('disconnected, retrying'); return; }
    // A rejected request closes the EventSource; fetch again for the reason
    const res = await fetch(url);
    status(res.ok ? 'stream closed' : (await res.json()).error);
    if (res.body) res.body.cancel();
  };
}

document.getElementById('apply').addEventListener('click', start);
window.addEventListener('load', async () => { await loadFiles(); start(); });
</script>
</body>
</html>
)HTML";

inline constexpr const char* kDashboardHtml = R"HTML(<!doctype html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>logtap dashboard</title>
<style>
  body { font-family: system-ui, sans-serif; margin: 1rem; }
  .grid { display: grid; grid-template-columns: 1fr 1fr; gap: 1rem; }
  .card { border: 1px solid #ddd; border-radius: 4px; padding: .5rem; }
  .card.wide { grid-column: 1 / span 2; }
  .panel { height: 30vh; overflow: auto; }
  .line { font: 12px ui-monospace, Menlo, Consolas, monospace; white-space: pre-wrap; }
  .ERROR { color: #b00020; } .WARNING { color: #9a6700; } .DEBUG { color: #777; }
  .note { color: #777; font-size: 12px; }
</style>
</head>
<body>
<div style="display:flex; justify-content:space-between">
  <h3 style="margin:0">logtap dashboard</h3>
  <div><a href="/">Single stream</a> <button id="reload">Reload streams</button></div>
</div>
<div id="grid" class="grid" style="margin-top:.75rem"></div>
<script>
const streams = {};

function append(panel, data) {
  const div = document.createElement('div');
  div.className = 'line';
  try { div.classList.add(String(JSON.parse(data).level || '').toUpperCase()); } catch (e) {}
  div.textContent = data;
  panel.appendChild(div);
  panel.scrollTop = panel.scrollHeight;
}

function openPanel(p) {
  if (streams[p.id]) streams[p.id].close();
  const body = document.getElementById('panel-' + p.id);
  const note = document.getElementById('note-' + p.id);
  body.innerHTML = '';
  if (!p.files.length) { note.textContent = 'no matching files'; return; }
  note.textContent = p.files.join(', ') + (p.filter ? '  |  ' + p.filter : '');
  const params = new URLSearchParams();
  params.set('filter', document.getElementById('filter-' + p.id).value.trim());
  streams[p.id] = new EventSource('/dashboard/stream/' + p.id + '?' + params.toString());
  streams[p.id].onmessage = (ev) => append(body, ev.data);
}

async function reload() {
  const panels = await (await fetch('/dashboard/panels')).json();
  const grid = document.getElementById('grid');
  panels.forEach((p, i) => {
    if (!document.getElementById('panel-' + p.id)) {
      const card = document.createElement('div');
      card.className = 'card' + (i === 0 ? ' wide' : '');
      card.innerHTML = '<b></b> <input placeholder="filter"> <div class="note"></div><div class="panel"></div>';
      card.querySelector('b').textContent = p.title;
      card.querySelector('input').id = 'filter-' + p.id;
      card.querySelector('input').value = p.filter;
      card.querySelector('.note').id = 'note-' + p.id;
      card.querySelector('.panel').id = 'panel-' + p.id;
      grid.appendChild(card);
    }
    openPanel(p);
  });
}

document.getElementById('reload').addEventListener('click', reload);
window.addEventListener('load', reload);
</script>
</body>
</html>
)HTML";

} // namespace logtap
